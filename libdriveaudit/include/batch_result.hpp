/**
 * @file batch_result.hpp
 * @brief Output of one batch run: reconciled drive groups, errors and counts.
 */

#ifndef DRIVEAUDIT_BATCH_RESULT_HPP
#define DRIVEAUDIT_BATCH_RESULT_HPP

#include "drive_record.hpp"
#include "parse_error.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

/**
 * @brief Identifies the record a merged value came from.
 */
struct SourceRef {
    std::string file_name;
    ReportFormat format = ReportFormat::Unsupported;
    std::size_t index = 0; ///< Section position inside file_name

    bool operator==(const SourceRef&) const = default;
};

/**
 * @brief A value observed for a field, and which record reported it.
 */
struct ObservedValue {
    std::string value;
    SourceRef source;

    bool operator==(const ObservedValue&) const = default;
};

/**
 * @brief Audit entry for one field of a merged record.
 *
 * Exists for every scalar field and every SMART attribute that at least
 * one member reported. When members disagree, conflict is set. observed
 * holds each member's value with its source, sorted by value and then by
 * source.
 */
struct FieldResolution {
    std::string field;          ///< Canonical field name ("model", "smart.194", ...)
    std::string chosen_value;
    SourceRef chosen;
    bool conflict = false;
    std::vector<ObservedValue> observed;

    bool operator==(const FieldResolution&) const = default;
};

/**
 * @brief All records judged to be the same physical drive, and their merge.
 */
struct ReconciliationGroup {
    std::string serial_number;
    std::vector<CanonicalDriveRecord> members; ///< Highest precedence first
    CanonicalDriveRecord merged;
    std::vector<FieldResolution> resolutions;

    [[nodiscard]] bool has_conflicts() const;
    [[nodiscard]] std::vector<std::string> source_files() const;

    bool operator==(const ReconciliationGroup&) const = default;
};

struct BatchSummary {
    std::size_t files_received = 0;    ///< Top-level inputs
    std::size_t archive_members = 0;   ///< Report files found inside archives
    std::size_t records_extracted = 0; ///< Canonical records before reconciliation
    std::size_t groups = 0;            ///< Distinct drives after reconciliation
    std::size_t duplicates_merged = 0; ///< records_extracted - groups
    std::size_t errors = 0;

    bool operator==(const BatchSummary&) const = default;
};

enum class BatchOutcome {
    Completed,           ///< Every input produced records or was legitimately empty
    CompletedWithErrors, ///< At least one ParseError, possibly zero records
    Cancelled            ///< Stop requested; results cover the tasks that finished
};

constexpr std::string_view to_string(const BatchOutcome outcome) noexcept {
    switch (outcome) {
        case BatchOutcome::Completed:           return "COMPLETED";
        case BatchOutcome::CompletedWithErrors: return "COMPLETED_WITH_ERRORS";
        case BatchOutcome::Cancelled:           return "CANCELLED";
    }
    return "COMPLETED";
}

/**
 * @brief Everything a batch run returns. Owned by the caller.
 */
struct BatchResult {
    std::vector<ReconciliationGroup> groups; ///< Sorted by serial number
    std::vector<ParseError> errors;          ///< In input order
    BatchSummary summary;
    BatchOutcome outcome = BatchOutcome::Completed;

    bool operator==(const BatchResult&) const = default;
};

inline bool ReconciliationGroup::has_conflicts() const {
    for (const auto& r : resolutions) {
        if (r.conflict) return true;
    }
    return false;
}

inline std::vector<std::string> ReconciliationGroup::source_files() const {
    std::vector<std::string> files;
    for (const auto& m : members) {
        bool seen = false;
        for (const auto& f : files) {
            if (f == m.source_file_name) { seen = true; break; }
        }
        if (!seen) files.push_back(m.source_file_name);
    }
    return files;
}

} // namespace driveaudit

#endif // DRIVEAUDIT_BATCH_RESULT_HPP
