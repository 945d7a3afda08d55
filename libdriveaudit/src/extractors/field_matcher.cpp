#include "../../include/field_matcher.hpp"
#include "../../include/string_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace driveaudit {

namespace {

constexpr std::size_t kFieldCount = static_cast<std::size_t>(Field::ReportDate) + 1;

// labels and their separators sit within the first bytes of a candidate; values are cut by offset
constexpr std::size_t kLabelWindow = 256;
constexpr std::size_t kMaxValueLength = 1024;

struct LabelPattern {
    Field field;
    int priority;       ///< Lower wins
    bool whole_value;   ///< Keep the remainder of the line instead of its first column
    std::regex re;
};

struct LabelSpec {
    Field field;
    const char* label;
};

// per field, in priority order
constexpr LabelSpec kLabelSpecs[] = {
    {Field::Serial,            R"(Hard\s*Disk\s*Serial\s*Number)"},
    {Field::Serial,            R"(VPD\s*Serial(?:\s*Number)?)"},
    {Field::Serial,            R"(Serial\s*(?:Number|No\.?|#))"},
    {Field::Serial,            R"(Serial)"},
    {Field::Model,             R"(Hard\s*Disk\s*Model\s*ID)"},
    {Field::Model,             R"(Hard\s*Disk\s*Model)"},
    {Field::Model,             R"((?:Device\s*)?Model\s*(?:ID|Number|Name)?)"},
    {Field::Model,             R"(Product(?:\s*ID)?)"},
    {Field::VendorInformation, R"(Vendor\s*Information)"},
    {Field::VendorInformation, R"(Vendor(?:\s*ID)?)"},
    {Field::VendorInformation, R"(Manufacturer)"},
    {Field::Firmware,          R"(Firmware\s*Revision)"},
    {Field::Firmware,          R"(Firmware(?:\s*Version)?)"},
    {Field::Firmware,          R"(Revision)"},
    {Field::Interface,         R"(Interface(?:\s*Type)?)"},
    {Field::Interface,         R"(Transport(?:\s*Protocol)?)"},
    {Field::Capacity,          R"(Total\s*Size)"},
    {Field::Capacity,          R"((?:User\s*|Disk\s*)?Capacity)"},
    {Field::Capacity,          R"((?:Disk\s*)?Size)"},
    {Field::Health,            R"(Overall\s*Health)"},
    {Field::Health,            R"(Health\s*Score)"},
    {Field::Health,            R"(Health)"},
    {Field::Status,            R"(SMART\s*overall-health\s*self-assessment\s*test\s*result)"},
    {Field::Status,            R"((?:S\.M\.A\.R\.T\.|SMART)\s*Status)"},
    {Field::Status,            R"((?:Overall|Drive|Disk)\s*Status)"},
    {Field::Status,            R"(Status)"},
    {Field::Temperature,       R"(Current\s*Temperature)"},
    {Field::Temperature,       R"((?:Drive\s*|Disk\s*)?Temperature)"},
    {Field::PowerOn,           R"(Power\s*on\s*time)"},
    {Field::PowerOn,           R"(Power[\s\-]*On\s*Hours)"},
    {Field::Reallocated,       R"(Reallocated\s*Sectors?\s*(?:Count|Co\.\.)?)"},
    {Field::Reallocated,       R"(Allocated\s*Sections)"},
    {Field::Reallocated,       R"(Reallocated)"},
    {Field::GrownDefects,      R"((?:Number\s*of\s*)?Grown\s*Defects?(?:\s*List)?(?:\s*Count)?)"},
    {Field::GrownDefects,      R"(Elements\s*in\s*grown\s*defect\s*list)"},
    {Field::GrownDefects,      R"(Defect\s*Count)"},
    {Field::ReportDate,        R"(Report\s*(?:Date|Created|Generated)(?:\s*on)?)"},
    {Field::ReportDate,        R"(Current\s*Date(?:\s*and\s*Time)?)"},
    {Field::ReportDate,        R"(Date(?:\s*and\s*Time)?|Generated(?:\s*on)?|Created)"},
};

const std::vector<LabelPattern>& label_patterns() {
    static const std::vector<LabelPattern> patterns = [] {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        std::vector<LabelPattern> out;
        std::array<int, kFieldCount> next_priority{};
        for (const auto& [field, label] : kLabelSpecs) {
            const bool whole = field == Field::Health || field == Field::Status;
            const std::string expr = std::string(R"(^\s*(?:[-*>]+\s*)?(?:)") + label +
                                     R"()\s*(?:\.\s*)*[:=])";
            out.push_back({field, next_priority[static_cast<std::size_t>(field)]++, whole, std::regex(expr, flags)});
        }
        return out;
    }();
    return patterns;
}

std::string* field_slot(RawDriveRecord& rec, const Field field) {
    switch (field) {
        case Field::Serial:            return &rec.serial;
        case Field::Model:             return &rec.model;
        case Field::VendorInformation: return &rec.vendor_information;
        case Field::Firmware:          return &rec.firmware;
        case Field::Interface:         return &rec.interface;
        case Field::Capacity:          return &rec.capacity;
        case Field::Health:            return &rec.health;
        case Field::Status:            return &rec.status;
        case Field::Temperature:       return &rec.temperature;
        case Field::PowerOn:           return &rec.power_on;
        case Field::Reallocated:       return &rec.reallocated;
        case Field::GrownDefects:      return &rec.grown_defects;
        case Field::ReportDate:        return &rec.report_date;
    }
    return nullptr;
}

// start offsets of the "label: value" candidates on a line: the line itself, then every column after a gap
std::vector<std::size_t> candidate_offsets(const std::string_view line) {
    std::vector<std::size_t> offsets{0};
    std::size_t i = 0;
    while (i < line.size()) {
        const bool tab = line[i] == '\t';
        const bool gap = line[i] == ' ' && i + 1 < line.size() && line[i + 1] == ' ';
        if (tab || gap) {
            while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
            if (i < line.size()) offsets.push_back(i);
        } else {
            ++i;
        }
    }
    return offsets;
}

// length of the "label:" prefix of @p candidate, if @p p labels it
std::optional<std::size_t> label_length(const std::string_view candidate, const LabelPattern& p) {
    const std::string_view head = candidate.substr(0, std::min(candidate.size(), kLabelWindow));
    std::cmatch m;
    if (!std::regex_search(head.data(), head.data() + head.size(), m, p.re, std::regex_constants::match_continuous)) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(m.length(0));
}

struct Match {
    int priority = -1;
    std::string value;
};

using MatchTable = std::array<Match, kFieldCount>;

void scan_line(const std::string_view line, MatchTable& best) {
    if (line.find(':') == std::string_view::npos && line.find('=') == std::string_view::npos) return;

    for (const std::size_t offset : candidate_offsets(line)) {
        const std::string_view candidate = line.substr(offset);
        for (const auto& p : label_patterns()) {
            Match& slot = best[static_cast<std::size_t>(p.field)];
            if (slot.priority >= 0 && slot.priority <= p.priority) continue;
            const auto prefix = label_length(candidate, p);
            if (!prefix) continue;
            const std::string_view raw = candidate.substr(*prefix, kMaxValueLength);
            const std::string_view value = p.whole_value ? trim(raw) : first_column(raw);
            if (value.empty()) continue;
            slot.priority = p.priority;
            slot.value = collapse_whitespace(value);
        }
    }
}

bool line_has_label(const std::string_view line) {
    MatchTable table;
    scan_line(line, table);
    for (const auto& m : table) {
        if (m.priority >= 0) return true;
    }
    return false;
}

// --- SMART table ---

enum class Column { Id, Name, Value, Worst, Threshold, Raw, Status, Other };

std::string header_key(const std::string& cell) {
    std::string key = to_lower_copy(trim(cell));
    while (!key.empty() && (key.back() == ':' || key.back() == '.')) key.pop_back();
    return key;
}

Column column_role(const std::string& key) {
    if (key == "id" || key == "#" || key == "id#" || key == "no" || key == "attr id" || key == "attribute id") return Column::Id;
    if (key.starts_with("attribute") || key == "name") return Column::Name;
    if (key == "value" || key == "current" || key == "cur" || key.starts_with("normalized")) return Column::Value;
    if (key == "worst") return Column::Worst;
    if (key == "threshold" || key == "thresh" || key == "thre" || key == "thr") return Column::Threshold;
    if (key.starts_with("raw") || key == "data") return Column::Raw;
    if (key == "status" || key == "state") return Column::Status;
    return Column::Other;
}

bool is_attribute_id(const std::string& cell) {
    if (cell.empty() || cell.size() > 4) return false;
    if (cell.size() > 2 && cell[0] == '0' && (cell[1] == 'x' || cell[1] == 'X')) {
        for (std::size_t i = 2; i < cell.size(); ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(cell[i]))) return false;
        }
        return true;
    }
    for (const char c : cell) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

bool is_block_marker(const std::string_view line) {
    if (!icontains(line, "disk") && !icontains(line, "drive") && !icontains(line, "scsi")) return false;

    constexpr auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    static const std::regex summary(R"(^Hard\s*Disk\s*Summary\s*:?$)", flags);
    static const std::regex numbered(R"(^(?:Hard\s+)?(?:Disk|Drive)\s*(?:#|No\.?)?\s*\d+)", flags);
    static const std::regex number_label(R"(^Hard\s*Disk\s*Number\b)", flags);
    static const std::regex banner(R"(SCSI\s*Toolbox)", flags);
    constexpr auto continuous = std::regex_constants::match_continuous;

    const std::string_view text = trim(line);
    const std::string_view head = text.substr(0, std::min(text.size(), kLabelWindow));
    const char* b = head.data();
    const char* e = head.data() + head.size();

    if (text.size() <= kLabelWindow && std::regex_match(b, e, summary)) return true;
    if (std::cmatch m; std::regex_search(b, e, m, numbered, continuous)) {
        // the number ends the line or is followed by a separator
        const std::string_view rest = trim(text.substr(static_cast<std::size_t>(m.length(0))));
        if (rest.empty() || std::string_view("-,:([").find(rest.front()) != std::string_view::npos) return true;
    }
    return std::regex_search(b, e, number_label, continuous) ||
           std::regex_search(text.data(), text.data() + text.size(), banner);
}

BlockSplit split_blocks(const std::string_view text) {
    BlockSplit result;
    const auto lines = split_lines(text);

    bool in_block = false;
    bool block_has_fields = false;
    TextBlock current;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        if (is_block_marker(line)) {
            if (!in_block) {
                in_block = true;
                current.first_line = i + 1;
            } else if (block_has_fields) {
                result.blocks.push_back(std::move(current));
                current = TextBlock{};
                current.first_line = i + 1;
                block_has_fields = false;
            }
        }
        std::string& sink = in_block ? current.text : result.preamble;
        sink.append(line);
        sink.push_back('\n');
        if (in_block && !block_has_fields && line_has_label(line)) {
            block_has_fields = true;
        }
    }
    if (in_block) {
        result.blocks.push_back(std::move(current));
    }
    return result;
}

void match_fields(const std::string_view block, RawDriveRecord& out) {
    MatchTable best;
    for (const auto line : split_lines(block)) {
        scan_line(line, best);
    }
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        if (best[i].priority < 0) continue;
        std::string* slot = field_slot(out, static_cast<Field>(i));
        if (slot && slot->empty()) {
            *slot = std::move(best[i].value);
        }
    }
    if (out.smart_rows.empty()) {
        out.smart_rows = parse_smart_table(block);
    }
}

std::optional<std::string> match_field(const std::string_view block, const Field field) {
    MatchTable best;
    for (const auto line : split_lines(block)) {
        scan_line(line, best);
    }
    const auto& m = best[static_cast<std::size_t>(field)];
    if (m.priority < 0) return std::nullopt;
    return m.value;
}

std::size_t count_serial_labels(const std::string_view block) {
    std::size_t count = 0;
    for (const auto line : split_lines(block)) {
        if (line.find(':') == std::string_view::npos && line.find('=') == std::string_view::npos) continue;
        for (const std::size_t offset : candidate_offsets(line)) {
            const std::string_view candidate = line.substr(offset);
            bool hit = false;
            for (const auto& p : label_patterns()) {
                if (p.field != Field::Serial) continue;
                if (label_length(candidate, p)) {
                    hit = true;
                    break;
                }
            }
            if (hit) {
                ++count;
                break;
            }
        }
    }
    return count;
}

bool has_labeled_fields(const std::string_view block) {
    for (const auto line : split_lines(block)) {
        if (line_has_label(line)) return true;
    }
    return false;
}

std::vector<RawSmartRow> parse_smart_table(const std::string_view block) {
    std::vector<RawSmartRow> rows;
    const auto lines = split_lines(block);

    std::size_t i = 0;
    std::vector<Column> roles;
    bool hex_raw = false;
    for (; i < lines.size(); ++i) {
        const auto cells = split_columns(lines[i]);
        if (cells.size() < 3) continue;
        std::vector<Column> candidate;
        bool id = false, name = false, data = false;
        bool hex = false;
        for (const auto& cell : cells) {
            const std::string key = header_key(cell);
            const Column role = column_role(key);
            id |= role == Column::Id;
            name |= role == Column::Name;
            data |= role == Column::Value || role == Column::Threshold || role == Column::Raw;
            if (role == Column::Raw && (key == "data" || key.find("hex") != std::string::npos)) hex = true;
            candidate.push_back(role);
        }
        if (id && name && data) {
            roles = std::move(candidate);
            hex_raw = hex;
            ++i;
            break;
        }
    }
    if (roles.empty()) return rows;

    for (; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) {
            if (!rows.empty()) break;
            continue;
        }
        const auto cells = split_columns(lines[i]);
        if (cells.size() != roles.size()) continue;

        RawSmartRow row;
        row.raw_is_hex = hex_raw;
        for (std::size_t c = 0; c < cells.size(); ++c) {
            switch (roles[c]) {
                case Column::Id:        row.id = cells[c]; break;
                case Column::Name:      row.name = cells[c]; break;
                case Column::Value:     row.value = cells[c]; break;
                case Column::Worst:     row.worst = cells[c]; break;
                case Column::Threshold: row.threshold = cells[c]; break;
                case Column::Raw:       row.raw = cells[c]; break;
                case Column::Status:    row.status = cells[c]; break;
                case Column::Other:     break;
            }
        }
        if (!is_attribute_id(row.id)) continue;
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace driveaudit
