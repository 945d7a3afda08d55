#include "../../include/archive_expander.hpp"
#include "../../include/format_sniffer.hpp"
#include "../../include/logger.hpp"
#include "../../include/string_utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace driveaudit {

namespace fs = std::filesystem;

static const char* expander_tag() {
    return "ArchiveExpander";
}

struct ArchiveExpander::TreeBudget {
    std::string top_name;        ///< Top-level archive charged for every nested byte
    std::uint64_t allowed = 0;   ///< Expanded bytes allowed for the whole tree
    std::uint64_t expanded = 0;  ///< Expanded bytes so far
};

struct ArchiveReadDeleter {
    void operator()(archive* a) const noexcept {
        if (a) archive_read_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// --- helpers ---

static std::string normalize_entry_name(std::string s) {
    for (auto& c : s) { if (c == '\\') c = '/'; }
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    return s;
}

// hidden files, resource forks and desktop metadata never hold reports
static bool is_junk_entry(const std::string& entry_name) {
    std::size_t start = 0;
    while (start <= entry_name.size()) {
        std::size_t end = entry_name.find('/', start);
        if (end == std::string::npos) end = entry_name.size();
        const std::string_view part(entry_name.data() + start, end - start);
        if (part == "__MACOSX" || (!part.empty() && part.front() == '.')) return true;
        if (end == entry_name.size()) break;
        start = end + 1;
    }
    const std::string base = to_lower_copy(fs::path(entry_name).filename().string());
    return base == "thumbs.db" || base == "desktop.ini";
}

// reject entries whose name would resolve outside dest_dir (zip-slip)
static bool sanitize_archive_entry_path(const std::string& entry_name, const fs::path& dest_dir) {
    if (entry_name.empty() || entry_name.find('\0') != std::string::npos) return false;

    const fs::path base = dest_dir.lexically_normal();
    const fs::path candidate = (base / fs::path(entry_name).relative_path()).lexically_normal();

    auto [base_end, cand_it] = std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
    if (base_end != base.end() && !base_end->empty()) return false;
    return candidate != base;
}

static std::uint64_t allowed_expansion(const std::uint64_t compressed, const std::uint64_t ratio) {
    std::uint64_t allowed = std::numeric_limits<std::uint64_t>::max();
    if (ratio == 0 || compressed <= allowed / ratio) {
        allowed = compressed * ratio;
    }
    return std::max(allowed, ArchiveExpander::kRatioSlackBytes);
}

// --- ArchiveMember ---

std::vector<unsigned char> ArchiveMember::load() const {
    return load_head(std::numeric_limits<std::size_t>::max());
}

std::vector<unsigned char> ArchiveMember::load_head(const std::size_t max_bytes) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("can't open extracted member " + path.string());
    }
    const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(size, max_bytes));
    std::vector<unsigned char> data(want);
    if (want > 0) {
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(want));
        if (static_cast<std::size_t>(in.gcount()) != want) {
            throw std::runtime_error("short read on extracted member " + path.string());
        }
    }
    return data;
}

// --- ArchiveExpander ---

ArchiveExpander::ArchiveExpander(WorkArea& area, ArchiveLimits limits)
    : area_(area), limits_(limits) {}

ExpansionResult ArchiveExpander::expand(const std::span<const unsigned char> data,
                                        const std::string& archive_name) const {
    TreeBudget budget;
    budget.top_name = archive_name;
    budget.allowed = allowed_expansion(data.size(), limits_.max_expansion_ratio);

    ExpansionResult out;
    expand_level(data, archive_name, 1, budget, out);

    Logger::log(LogLevel::Info,
                "Expanded " + archive_name + ": " + std::to_string(out.members.size()) + " member(s), " +
                std::to_string(out.errors.size()) + " error(s), " + std::to_string(budget.expanded) + " bytes",
                expander_tag());
    return out;
}

void ArchiveExpander::expand_level(const std::span<const unsigned char> data,
                                   const std::string& archive_name,
                                   const unsigned depth,
                                   TreeBudget& budget,
                                   ExpansionResult& out) const {
    ArchiveReadPtr a(archive_read_new());
    if (!a) {
        throw std::runtime_error("archive_read_new failed");
    }
    archive_read_support_filter_none(a.get());
    archive_read_support_format_zip(a.get());

    int r = archive_read_open_memory(a.get(), data.data(), data.size());
    if (r != ARCHIVE_OK) {
        const char* why = archive_error_string(a.get());
        Logger::log(LogLevel::Warning, "Can't open archive " + archive_name + ": " + (why ? why : "unknown error"), expander_tag());
        out.errors.emplace_back(archive_name, ReportFormat::Zip, ErrorReason::ArchiveCorrupt,
                                std::string("cannot open archive: ") + (why ? why : "unknown error"));
        return;
    }

    // everything found in this archive, published only if the archive reads cleanly to the end
    ExpansionResult local;
    const fs::path dest_dir = area_.make_subdir("zip");
    std::vector<char> buffer(64 * 1024);
    std::size_t entries = 0;
    archive_entry* entry = nullptr;

    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* raw_name = archive_entry_pathname_utf8(entry);
        if (!raw_name) raw_name = archive_entry_pathname(entry);
        if (!raw_name || archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(a.get());
            continue;
        }

        const std::string entry_name = normalize_entry_name(raw_name);
        if (entry_name.empty() || is_junk_entry(entry_name)) {
            Logger::log(LogLevel::Debug, "Skipping junk entry " + entry_name + " in " + archive_name, expander_tag());
            archive_read_data_skip(a.get());
            continue;
        }

        if (++entries > limits_.max_members) {
            Logger::log(LogLevel::Warning, archive_name + " has more than " + std::to_string(limits_.max_members) + " members", expander_tag());
            out.errors.emplace_back(archive_name, ReportFormat::Zip, ErrorReason::ArchiveCorrupt,
                                    "archive has more than " + std::to_string(limits_.max_members) + " members");
            return;
        }

        const std::string member_name = archive_name + "/" + entry_name;

        if (archive_entry_is_encrypted(entry)) {
            local.errors.emplace_back(member_name, ReportFormat::Unsupported, ErrorReason::ArchiveCorrupt,
                                      "member is encrypted");
            archive_read_data_skip(a.get());
            continue;
        }

        if (archive_entry_size_is_set(entry) &&
            static_cast<std::uint64_t>(archive_entry_size(entry)) > limits_.max_member_size) {
            local.errors.emplace_back(member_name, ReportFormat::Unsupported, ErrorReason::ArchiveCorrupt,
                                      "member size " + std::to_string(archive_entry_size(entry)) +
                                      " exceeds limit of " + std::to_string(limits_.max_member_size) + " bytes");
            archive_read_data_skip(a.get());
            continue;
        }

        if (!sanitize_archive_entry_path(entry_name, dest_dir)) {
            Logger::log(LogLevel::Warning, "Skipping suspicious archive entry (path traversal): " + entry_name, expander_tag());
            local.errors.emplace_back(member_name, ReportFormat::Unsupported, ErrorReason::ArchiveCorrupt,
                                      "member path escapes the archive root");
            archive_read_data_skip(a.get());
            continue;
        }

        // stored under its ordinal: entry names may repeat or collide with a directory prefix
        const fs::path out_path = dest_dir / ("member_" + std::to_string(entries));
        std::error_code ec;
        std::ofstream ofs(out_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("can't write extracted member " + out_path.string());
        }

        std::uint64_t written = 0;
        bool oversized = false;
        la_ssize_t n = 0;
        while ((n = archive_read_data(a.get(), buffer.data(), buffer.size())) > 0) {
            const auto chunk = static_cast<std::uint64_t>(n);
            budget.expanded += chunk;
            if (budget.expanded > budget.allowed) {
                Logger::log(LogLevel::Error, "Archive bomb detected in " + budget.top_name, expander_tag());
                throw ResourceExhaustedError(
                    budget.top_name + " expands beyond " + std::to_string(limits_.max_expansion_ratio) +
                    "x its compressed size", budget.top_name);
            }
            written += chunk;
            if (written > limits_.max_member_size) {
                oversized = true;
                break;
            }
            area_.reserve(chunk, budget.top_name);
            ofs.write(buffer.data(), n);
        }
        ofs.close();

        if (n < 0) {
            const char* why = archive_error_string(a.get());
            Logger::log(LogLevel::Warning, "Error reading " + member_name + ": " + (why ? why : "unknown error"), expander_tag());
            out.errors.emplace_back(archive_name, ReportFormat::Zip, ErrorReason::ArchiveCorrupt,
                                    "error reading member " + entry_name + ": " + (why ? why : "unknown error"));
            return;
        }

        if (oversized) {
            fs::remove(out_path, ec);
            local.errors.emplace_back(member_name, ReportFormat::Unsupported, ErrorReason::ArchiveCorrupt,
                                      "member exceeds limit of " + std::to_string(limits_.max_member_size) + " bytes");
            archive_read_data_skip(a.get());
            continue;
        }

        ArchiveMember member{member_name, out_path, written, ReportFormat::Unsupported, depth};
        member.format = FormatSniffer::sniff(member.load_head(FormatSniffer::kSniffWindow), member_name);

        if (member.format == ReportFormat::Zip) {
            if (depth + 1 > limits_.max_depth) {
                Logger::log(LogLevel::Warning, "Nested archive too deep: " + member_name, expander_tag());
                local.errors.emplace_back(member_name, ReportFormat::Zip, ErrorReason::NestedArchiveDepthExceeded,
                                          "archive at depth " + std::to_string(depth + 1) +
                                          " exceeds the limit of " + std::to_string(limits_.max_depth));
            } else {
                const auto nested = member.load();
                expand_level(nested, member_name, depth + 1, budget, local);
            }
            fs::remove(out_path, ec);
            continue;
        }

        Logger::log(LogLevel::Debug, "Extracted " + member_name + " as " + std::string(to_string(member.format)), expander_tag());
        local.members.push_back(std::move(member));
    }

    if (r != ARCHIVE_EOF) {
        const char* why = archive_error_string(a.get());
        Logger::log(LogLevel::Warning, "Error during iteration of " + archive_name + ": " + (why ? why : "unknown error"), expander_tag());
        out.errors.emplace_back(archive_name, ReportFormat::Zip, ErrorReason::ArchiveCorrupt,
                                std::string("archive is truncated or corrupt: ") + (why ? why : "unknown error"));
        return;
    }

    std::ranges::move(local.members, std::back_inserter(out.members));
    std::ranges::move(local.errors, std::back_inserter(out.errors));
}

} // namespace driveaudit
