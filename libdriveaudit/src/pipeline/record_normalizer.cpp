#include "../../include/record_normalizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/string_utils.hpp"
#include "../../include/vendor.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <regex>
#include <sstream>
#include <vector>

namespace driveaudit {

static const char* normalizer_tag() {
    return "Normalizer";
}

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

constexpr std::string_view kFailWords[] = {"failed", "fail", "failing", "bad", "poor", "critical"};
constexpr std::string_view kWarnWords[] = {"warning", "warn", "fair", "degraded", "caution"};
constexpr std::string_view kPassWords[] = {"passed", "pass", "ok", "good", "excellent", "healthy", "perfect"};

std::vector<std::string> words_of(const std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (const char c : text) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

template <std::size_t N>
bool has_any(const std::vector<std::string>& words, const std::string_view (&vocabulary)[N]) {
    return std::ranges::any_of(words, [&](const std::string& w) {
        return std::ranges::find(vocabulary, std::string_view(w)) != std::end(vocabulary);
    });
}

std::optional<HealthVerdict> verdict_from_words(const std::string_view text) {
    const auto words = words_of(text);
    if (has_any(words, kFailWords)) return HealthVerdict::Fail;
    if (has_any(words, kWarnWords)) return HealthVerdict::Warn;
    if (has_any(words, kPassWords)) return HealthVerdict::Pass;
    return std::nullopt;
}

std::optional<std::uint64_t> to_u64(const std::string_view digits, const int base = 10) {
    if (digits.empty()) return std::nullopt;
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
    return value;
}

std::string digits_only(const std::string_view s) {
    std::string out;
    for (const char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) out.push_back(c);
    }
    return out;
}

// leading unsigned integer of a table cell ("100", "100 (pre-fail)")
std::optional<unsigned> leading_unsigned(const std::string_view cell) {
    const std::string_view t = trim(cell);
    std::size_t n = 0;
    while (n < t.size() && n < 9 && std::isdigit(static_cast<unsigned char>(t[n]))) ++n;
    if (n == 0) return std::nullopt;
    const auto value = to_u64(t.substr(0, n));
    if (!value) return std::nullopt;
    return static_cast<unsigned>(*value);
}

std::optional<unsigned> parse_attribute_id(const std::string_view cell) {
    const std::string_view t = trim(cell);
    std::optional<std::uint64_t> id;
    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) {
        id = to_u64(t.substr(2), 16);
    } else {
        id = to_u64(t);
    }
    if (!id || *id == 0 || *id > 255) return std::nullopt;
    return static_cast<unsigned>(*id);
}

bool ends_with_icase(const std::string& s, const std::string_view suffix) {
    return s.size() >= suffix.size() && to_upper_copy(std::string_view(s).substr(s.size() - suffix.size())) == suffix;
}

std::uint64_t smart_mask(const unsigned id) {
    switch (id) {
        case 190:
        case 194:
            return 0xFFull;
        case 9:
            return 0xFFFFFFFFull;
        default:
            return 0xFFFFFFFFFFFFull;
    }
}

} // namespace

RecordNormalizer::RecordNormalizer(const Timestamp reference_time)
    : reference_time_(reference_time) {}

std::string RecordNormalizer::normalize_serial(const std::string_view raw) {
    std::string s;
    for (const char c : raw) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }

    for (std::size_t pos; (pos = s.find("TOTALSIZE")) != std::string::npos;) {
        s.erase(pos, 9);
    }

    constexpr std::size_t kGroup = 4;
    constexpr std::size_t kMinCore = 8;
    if (s.size() >= kMinCore + 2 * kGroup) {
        const std::string group = s.substr(s.size() - kGroup);
        std::size_t repeats = 1;
        while (s.size() >= (repeats + 1) * kGroup &&
               s.compare(s.size() - (repeats + 1) * kGroup, kGroup, group) == 0) {
            ++repeats;
        }
        if (repeats >= 2 && s.size() - repeats * kGroup >= kMinCore) {
            s.resize(s.size() - repeats * kGroup);
        }
    }

    std::erase_if(s, [](const char c) {
        return !(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.');
    });

    if (s.size() < 3 || s == "N/A" || s == "NA" || s == "UNKNOWN" || s == "NONE") {
        return {};
    }
    return s;
}

InterfaceType RecordNormalizer::parse_interface(const std::string_view text) {
    const std::string upper = to_upper_copy(text);
    if (upper.find("NVME") != std::string::npos || upper.find("PCIE") != std::string::npos) return InterfaceType::Nvme;
    if (upper.find("SAS") != std::string::npos || upper.find("SCSI") != std::string::npos) return InterfaceType::Sas;
    if (upper.find("SATA") != std::string::npos || upper.find("S-ATA") != std::string::npos ||
        upper.find("ATA") != std::string::npos) return InterfaceType::Sata;
    return InterfaceType::Unknown;
}

std::uint64_t RecordNormalizer::parse_capacity(const std::string_view text) {
    const std::string s(trim(text));
    if (s.empty()) return 0;

    static const std::regex bytes_re(R"((\d[\d,. ]*)\s*bytes)", kRegexFlags);
    static const std::regex unit_re(R"((\d+(?:[.,]\d+)?)\s*(KiB|MiB|GiB|TiB|PiB|KB|MB|GB|TB|PB|K|M|G|T)\b)", kRegexFlags);

    std::smatch m;
    if (std::regex_search(s, m, bytes_re)) {
        if (const auto v = to_u64(digits_only(m[1].str()))) return *v;
    }

    if (std::regex_search(s, m, unit_re)) {
        std::string number = m[1].str();
        if (const auto comma = number.find(','); comma != std::string::npos) {
            // "1,000 GB" groups thousands, "1,5 TB" is a decimal comma
            if (number.size() - comma - 1 == 3) {
                number.erase(comma, 1);
            } else {
                number[comma] = '.';
            }
        }
        const std::string unit = to_upper_copy(m[2].str());
        const bool binary = unit.size() == 3;
        const long double base = binary ? 1024.0L : 1000.0L;
        int power = 0;
        switch (unit[0]) {
            case 'K': power = 1; break;
            case 'M': power = 2; break;
            case 'G': power = 3; break;
            case 'T': power = 4; break;
            case 'P': power = 5; break;
            default: break;
        }
        std::istringstream in(number);
        in.imbue(std::locale::classic());
        long double value = 0;
        if (in >> value && value >= 0) {
            const long double bytes = std::round(value * std::pow(base, power));
            // beyond 2^64 bytes the figure is not a real capacity
            if (bytes >= 0x1p64L) return 0;
            return static_cast<std::uint64_t>(bytes);
        }
    }

    if (std::ranges::all_of(s, [](const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return to_u64(s).value_or(0);
    }
    return 0;
}

HealthVerdict RecordNormalizer::parse_health(const std::string_view status, const std::string_view health) {
    if (const auto v = verdict_from_words(status)) return *v;
    if (const auto v = verdict_from_words(health)) return *v;
    if (const auto percent = parse_health_percent(health)) {
        if (*percent >= 70) return HealthVerdict::Pass;
        if (*percent >= 30) return HealthVerdict::Warn;
        return HealthVerdict::Fail;
    }
    return HealthVerdict::Unknown;
}

std::optional<unsigned> RecordNormalizer::parse_health_percent(const std::string_view health) {
    static const std::regex number_re(R"((\d+))", kRegexFlags);
    const std::string s(health);
    for (auto it = std::sregex_iterator(s.begin(), s.end(), number_re); it != std::sregex_iterator(); ++it) {
        const std::string digits = (*it)[1].str();
        if (digits.size() > 3) continue;
        const auto value = to_u64(digits);
        if (value && *value <= 100) return static_cast<unsigned>(*value);
    }
    return std::nullopt;
}

std::optional<int> RecordNormalizer::parse_temperature(const std::string_view text) {
    static const std::regex temp_re("(-?\\d+(?:\\.\\d+)?)\\s*(?:\xC2\xB0|\xC2\xBA|[Dd]eg(?:rees)?\\.?)?\\s*([CcFf])?");
    const std::string s(text);
    std::smatch m;
    if (!std::regex_search(s, m, temp_re)) return std::nullopt;

    std::istringstream in(m[1].str());
    in.imbue(std::locale::classic());
    double value = 0;
    if (!(in >> value)) return std::nullopt;

    if (m[2].matched && (m[2].str() == "F" || m[2].str() == "f")) {
        value = (value - 32.0) * 5.0 / 9.0;
    }
    const long rounded = std::lround(value);
    if (rounded < -40 || rounded > 150) return std::nullopt;
    return static_cast<int>(rounded);
}

std::optional<std::uint64_t> RecordNormalizer::parse_power_on_hours(const std::string_view text) {
    static const std::regex years_re(R"((\d+)\s*(?:years?|yrs?)\b)", kRegexFlags);
    static const std::regex days_re(R"((\d+)\s*days?\b)", kRegexFlags);
    static const std::regex hours_re(R"((\d+)\s*(?:hours?|hrs?|h)\b)", kRegexFlags);

    const std::string s(text);
    std::smatch m;
    std::uint64_t total = 0;
    bool any = false;
    if (std::regex_search(s, m, years_re)) {
        total += to_u64(m[1].str()).value_or(0) * 8760;
        any = true;
    }
    if (std::regex_search(s, m, days_re)) {
        total += to_u64(m[1].str()).value_or(0) * 24;
        any = true;
    }
    if (std::regex_search(s, m, hours_re)) {
        total += to_u64(m[1].str()).value_or(0);
        any = true;
    }
    if (any) return total;
    return parse_count(text);
}

std::optional<std::uint64_t> RecordNormalizer::parse_count(const std::string_view text) {
    static const std::regex count_re(R"((\d{1,3}(?:,\d{3})+|\d+))", kRegexFlags);
    const std::string s(text);
    std::smatch m;
    if (!std::regex_search(s, m, count_re)) return std::nullopt;
    return to_u64(digits_only(m[1].str()));
}

std::optional<std::uint64_t> RecordNormalizer::parse_smart_raw(const unsigned id,
                                                               const std::string_view raw,
                                                               const bool hex_hint) {
    std::string_view t = trim(raw);
    if (t.empty()) return std::nullopt;

    bool hex = hex_hint;
    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) {
        t.remove_prefix(2);
        hex = true;
    }

    std::optional<std::uint64_t> value;
    std::size_t hex_len = 0;
    bool hex_letters = false;
    while (hex_len < t.size() && std::isxdigit(static_cast<unsigned char>(t[hex_len]))) {
        if (std::isalpha(static_cast<unsigned char>(t[hex_len]))) hex_letters = true;
        ++hex_len;
    }
    if (hex_letters && hex_len == t.size()) hex = true;

    if (hex) {
        if (hex_len == 0) return std::nullopt;
        std::string_view digits = t.substr(0, hex_len);
        if (digits.size() > 16) digits.remove_prefix(digits.size() - 16);
        value = to_u64(digits, 16);
    } else {
        std::size_t n = 0;
        while (n < t.size() && n < 19 && std::isdigit(static_cast<unsigned char>(t[n]))) ++n;
        value = to_u64(t.substr(0, n));
    }
    if (!value) return std::nullopt;
    return *value & smart_mask(id);
}

AttributeStatus RecordNormalizer::parse_attribute_status(const std::string_view text,
                                                         const std::optional<unsigned> value,
                                                         const std::optional<unsigned> threshold) {
    const std::string lower = to_lower_copy(text);
    if (lower.find("fail") != std::string::npos || lower.find("bad") != std::string::npos) return AttributeStatus::Failing;
    if (lower.find("warn") != std::string::npos || lower.find("degraded") != std::string::npos ||
        lower.find("caution") != std::string::npos) return AttributeStatus::Warning;
    const auto words = words_of(text);
    if (std::ranges::any_of(words, [](const std::string& w) {
            return w == "ok" || w == "good" || w == "pass" || w == "passed" || w == "normal";
        })) {
        return AttributeStatus::Ok;
    }

    if (value && threshold) {
        return (*threshold > 0 && *value <= *threshold) ? AttributeStatus::Failing : AttributeStatus::Ok;
    }
    return AttributeStatus::Unknown;
}

std::optional<Timestamp> RecordNormalizer::parse_timestamp(const std::string_view text) {
    std::string s = collapse_whitespace(text);
    for (const std::string_view zone : {" UTC", " GMT", "Z"}) {
        if (ends_with_icase(s, zone)) {
            s.resize(s.size() - zone.size());
            break;
        }
    }

    int meridiem = -1; // hour offset: 0 for AM, 12 for PM
    if (ends_with_icase(s, " AM")) meridiem = 0;
    if (ends_with_icase(s, " PM")) meridiem = 12;
    if (meridiem >= 0) s.resize(s.size() - 3);

    static constexpr const char* kFormats[] = {
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M",
        "%Y.%m.%d %H:%M:%S",
        "%Y/%m/%d %H:%M:%S",
        "%d.%m.%Y %H:%M:%S",
        "%d.%m.%Y %H:%M",
        "%m/%d/%Y %H:%M:%S",
        "%m/%d/%Y %H:%M",
        "%d %b %Y %H:%M:%S",
        "%a %b %d %H:%M:%S %Y",
        "%Y-%m-%d",
        "%Y.%m.%d",
        "%Y/%m/%d",
        "%d.%m.%Y",
        "%m/%d/%Y",
        "%d %b %Y",
        "%b %d, %Y",
    };

    for (const char* format : kFormats) {
        std::tm tm{};
        std::istringstream in(s);
        in.imbue(std::locale::classic());
        in >> std::get_time(&tm, format);
        if (in.fail()) continue;
        std::string rest;
        std::getline(in, rest);
        if (!trim(rest).empty()) continue;

        int hour = tm.tm_hour;
        if (meridiem >= 0) {
            if (hour < 1 || hour > 12) continue;
            hour = hour % 12 + meridiem;
        }

        using namespace std::chrono;
        const int y = tm.tm_year + 1900;
        if (y < 1990 || y > 9999) continue;
        const year_month_day ymd{year{y}, month{static_cast<unsigned>(tm.tm_mon + 1)},
                                 day{static_cast<unsigned>(tm.tm_mday)}};
        if (!ymd.ok() || hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) continue;
        return Timestamp{sys_days{ymd} + hours{hour} + minutes{tm.tm_min} + seconds{tm.tm_sec}};
    }
    return std::nullopt;
}

std::variant<CanonicalDriveRecord, ParseError> RecordNormalizer::normalize(const RawDriveRecord& raw) const {
    const std::optional<std::string> location = raw.location.empty() ? std::nullopt : std::optional(raw.location);
    std::vector<std::string> encodings;
    if (!raw.encoding.empty()) encodings.push_back(raw.encoding);

    CanonicalDriveRecord rec;
    rec.serial_number = normalize_serial(raw.serial);
    if (rec.serial_number.empty()) {
        Logger::log(LogLevel::Debug, raw.source_file_name + ": unusable serial \"" + raw.serial + "\"", normalizer_tag());
        return ParseError(raw.source_file_name, raw.source_format, ErrorReason::MissingRequiredField,
                          raw.serial.empty() ? std::string("no serial number")
                                             : "serial number \"" + raw.serial + "\" is not usable",
                          location, std::move(encodings));
    }

    rec.label_serial = label_serial_of(rec.serial_number);
    rec.model = collapse_whitespace(raw.model);
    rec.vendor = derive_vendor(rec.model);
    rec.vendor_information = collapse_whitespace(raw.vendor_information);
    rec.firmware_revision = collapse_whitespace(raw.firmware);
    rec.interface_type = parse_interface(raw.interface);
    rec.capacity_bytes = parse_capacity(raw.capacity);
    rec.overall_health = parse_health(raw.status, raw.health);
    rec.health_percent = parse_health_percent(raw.health);
    rec.temperature_celsius = parse_temperature(raw.temperature);
    rec.power_on_hours = parse_power_on_hours(raw.power_on);
    rec.reallocated_sectors = parse_count(raw.reallocated);
    rec.grown_defects = parse_count(raw.grown_defects);

    for (const auto& row : raw.smart_rows) {
        const auto id = parse_attribute_id(row.id);
        if (!id || rec.smart_attributes.contains(*id)) continue;
        SmartAttribute attr;
        attr.id = *id;
        attr.name = collapse_whitespace(row.name);
        attr.raw_value = parse_smart_raw(*id, row.raw, row.raw_is_hex);
        attr.normalized_value = leading_unsigned(row.value);
        attr.worst = leading_unsigned(row.worst);
        attr.threshold = leading_unsigned(row.threshold);
        attr.status = parse_attribute_status(row.status, attr.normalized_value, attr.threshold);
        rec.smart_attributes.emplace(*id, std::move(attr));
    }

    const auto smart_raw = [&](const unsigned id) -> std::optional<std::uint64_t> {
        const auto it = rec.smart_attributes.find(id);
        if (it == rec.smart_attributes.end()) return std::nullopt;
        return it->second.raw_value;
    };
    if (!rec.temperature_celsius) {
        for (const unsigned id : {194u, 190u}) {
            if (const auto t = smart_raw(id); t && *t <= 150) {
                rec.temperature_celsius = static_cast<int>(*t);
                break;
            }
        }
    }
    if (!rec.power_on_hours) rec.power_on_hours = smart_raw(9);
    if (!rec.reallocated_sectors) rec.reallocated_sectors = smart_raw(5);

    rec.source_file_name = raw.source_file_name;
    rec.source_format = raw.source_format;
    rec.source_index = raw.index;
    rec.source_encoding = raw.encoding;
    rec.extracted_at = parse_timestamp(raw.report_date).value_or(reference_time_);
    rec.raw_excerpt = bounded_copy(raw.excerpt, kMaxRawExcerpt);
    return rec;
}

} // namespace driveaudit
