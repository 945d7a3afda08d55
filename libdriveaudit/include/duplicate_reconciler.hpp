/**
 * @file duplicate_reconciler.hpp
 * @brief Groups records of the same physical drive and merges them.
 */

#ifndef DRIVEAUDIT_DUPLICATE_RECONCILER_HPP
#define DRIVEAUDIT_DUPLICATE_RECONCILER_HPP

#include "batch_result.hpp"
#include "drive_record.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

/**
 * @brief Serial-keyed grouping and field-level merge.
 *
 * @details Records are grouped by serial number, trimmed and upper-cased;
 * that is the only key, so a model or capacity mismatch inside a group is
 * a conflict rather than a different drive. Two distinct drives reporting
 * the same serial are merged.
 *
 * Members are ranked by, in order: completeness (populated fields plus
 * SMART attributes), most recent extracted_at, source format (PDF, then
 * HTML, then TEXT), then file name and section index, and finally the
 * record content itself. Each merged field
 * comes from the highest-ranked member that reports it; extracted_at is the
 * latest of the group. The ranking is a total order, so the result does
 * not depend on input order.
 */
class DuplicateReconciler {
public:
    [[nodiscard]] std::vector<ReconciliationGroup> reconcile(std::vector<CanonicalDriveRecord> records) const;

    /// Grouping key of a serial number.
    static std::string group_key(std::string_view serial);

    /// Populated optional fields plus the number of SMART attributes.
    static std::size_t completeness(const CanonicalDriveRecord& record);

    /// True when @p a takes precedence over @p b.
    static bool outranks(const CanonicalDriveRecord& a, const CanonicalDriveRecord& b);
};

} // namespace driveaudit

#endif // DRIVEAUDIT_DUPLICATE_RECONCILER_HPP
