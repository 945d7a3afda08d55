/**
 * @file archive_expander.hpp
 * @brief Bounded, recursive expansion of ZIP archives into report candidates.
 */

#ifndef DRIVEAUDIT_ARCHIVE_EXPANDER_HPP
#define DRIVEAUDIT_ARCHIVE_EXPANDER_HPP

#include "parse_error.hpp"
#include "report_format.hpp"
#include "work_area.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace driveaudit {

/**
 * @brief Bounds enforced while expanding one top-level archive.
 */
struct ArchiveLimits {
    unsigned max_depth = 3;                            ///< A top-level archive is depth 1
    std::uint64_t max_expansion_ratio = 100;           ///< Expanded bytes per compressed byte, whole tree
    std::size_t max_members = 1000;                    ///< File entries per archive
    std::uint64_t max_member_size = 100ull * 1024 * 1024; ///< Bytes per extracted member
};

/**
 * @brief A report candidate materialized inside the work area.
 *
 * Bytes stay on disk until a worker loads them.
 */
struct ArchiveMember {
    std::string name;            ///< "outer.zip/dir/report.html"
    std::filesystem::path path;  ///< Location inside the WorkArea
    std::uint64_t size = 0;
    ReportFormat format = ReportFormat::Unsupported; ///< Sniffed classification
    unsigned depth = 1;          ///< Depth of the archive that contained it

    /**
     * @brief Read the whole member.
     * @throws std::runtime_error if the file can't be read.
     */
    [[nodiscard]] std::vector<unsigned char> load() const;

    /**
     * @brief Read at most @p max_bytes from the start of the member.
     * @throws std::runtime_error if the file can't be read.
     */
    [[nodiscard]] std::vector<unsigned char> load_head(std::size_t max_bytes) const;
};

/**
 * @brief Members and errors produced by one top-level archive.
 *
 * Nested archives are expanded in place: members appear in depth-first
 * archive order and never include another ZIP.
 */
struct ExpansionResult {
    std::vector<ArchiveMember> members;
    std::vector<ParseError> errors;
};

/**
 * @brief Expands ZIP archives with libarchive into a WorkArea.
 *
 * Recoverable violations become ParseErrors scoped to the member or to
 * the archive they occur in:
 * - unreadable or truncated archive, too many members: ARCHIVE_CORRUPT
 *   for the archive, none of its members are returned;
 * - encrypted or oversized member: ARCHIVE_CORRUPT for that member;
 * - an archive deeper than max_depth: NESTED_ARCHIVE_DEPTH_EXCEEDED.
 *
 * Expanded bytes beyond max_expansion_ratio times the top-level
 * compressed size, or beyond the work area budget, throw
 * ResourceExhaustedError.
 *
 * Directories, hidden entries and __MACOSX metadata are skipped silently.
 */
class ArchiveExpander {
public:
    /// Expanded bytes always allowed regardless of ratio, so tiny archives of text pass.
    static constexpr std::uint64_t kRatioSlackBytes = 1024 * 1024;

    ArchiveExpander(WorkArea& area, ArchiveLimits limits);

    /**
     * @brief Expand a top-level archive.
     * @param data Compressed archive bytes.
     * @param archive_name Name used as prefix for member names and in errors.
     * @throws ResourceExhaustedError on ratio or budget violations.
     */
    [[nodiscard]] ExpansionResult expand(std::span<const unsigned char> data,
                                         const std::string& archive_name) const;

    [[nodiscard]] const ArchiveLimits& limits() const noexcept { return limits_; }

private:
    struct TreeBudget;

    void expand_level(std::span<const unsigned char> data,
                      const std::string& archive_name,
                      unsigned depth,
                      TreeBudget& budget,
                      ExpansionResult& out) const;

    WorkArea& area_;
    ArchiveLimits limits_;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_ARCHIVE_EXPANDER_HPP
