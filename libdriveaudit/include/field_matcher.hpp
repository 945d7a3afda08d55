/**
 * @file field_matcher.hpp
 * @brief Labeled-field matching and block splitting shared by the text-like dialects.
 *
 * The HTML extractor flattens the DOM, the PDF extractor rebuilds rows from
 * glyph positions, and both then go through the same line-oriented matching
 * as plain-text reports.
 */

#ifndef DRIVEAUDIT_FIELD_MATCHER_HPP
#define DRIVEAUDIT_FIELD_MATCHER_HPP

#include "extractor.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

    enum class Field {
        Serial,
        Model,
        VendorInformation,
        Firmware,
        Interface,
        Capacity,
        Health,
        Status,
        Temperature,
        PowerOn,
        Reallocated,
        GrownDefects,
        ReportDate
    };

    /**
     * @brief A contiguous run of lines describing one drive.
     */
    struct TextBlock {
        std::string text;
        std::size_t first_line = 1; ///< 1-based line number of the block start in the source text
    };

    /**
     * @brief Result of splitting a report at drive boundaries.
     */
    struct BlockSplit {
        std::string preamble;          ///< Text before the first boundary
        std::vector<TextBlock> blocks; ///< Empty when no boundary marker exists
    };

    /**
     * @brief Split a report at drive boundary markers.
     *
     * Markers are a "Hard Disk Summary" header, "Drive N" / "Disk N" /
     * "Hard Disk N" lines, "Hard Disk Number" label lines and a
     * "SCSI Toolbox" banner. A marker that follows another marker with no
     * labeled field in between continues the current block, so
     * "Hard Disk Summary" followed by "Hard Disk Number : 0" is one drive.
     */
    BlockSplit split_blocks(std::string_view text);

    /// True when @p line is a drive boundary marker.
    bool is_block_marker(std::string_view line);

    /**
     * @brief Fill the empty fields of @p out from labeled lines in @p block.
     *
     * For each field the label patterns are tried in priority order and the
     * first line matching the best pattern wins. Lines holding several
     * "label: value" pairs separated by column gaps are matched per pair.
     */
    void match_fields(std::string_view block, RawDriveRecord& out);

    /**
     * @brief Value of @p field in @p block, if any line carries it.
     */
    std::optional<std::string> match_field(std::string_view block, Field field);

    /// Number of lines carrying a serial-number label.
    std::size_t count_serial_labels(std::string_view block);

    /// True when @p block has at least one labeled field line of any kind.
    bool has_labeled_fields(std::string_view block);

    /**
     * @brief Parse SMART attribute rows under a recognized column header.
     *
     * The header must name an id column, an attribute-name column and at
     * least one of value, threshold or raw. Rows whose cell count differs from
     * the header or whose id is not numeric are skipped. A raw column titled
     * "Data" or mentioning "hex" marks raw values as hexadecimal.
     */
    std::vector<RawSmartRow> parse_smart_table(std::string_view block);

} // namespace driveaudit

#endif // DRIVEAUDIT_FIELD_MATCHER_HPP
