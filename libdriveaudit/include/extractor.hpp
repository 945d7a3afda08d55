/**
 * @file extractor.hpp
 * @brief Interface shared by the per-dialect report extractors.
 */

#ifndef DRIVEAUDIT_EXTRACTOR_HPP
#define DRIVEAUDIT_EXTRACTOR_HPP

#include "parse_error.hpp"
#include "report_format.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

/**
 * @brief One SMART table row as printed by the report, before normalization.
 */
struct RawSmartRow {
    std::string id;
    std::string name;
    std::string value;     ///< Normalized (current) value column
    std::string worst;
    std::string threshold;
    std::string raw;       ///< Raw value column, in whatever base the dialect prints
    std::string status;
    bool raw_is_hex = false; ///< The dialect prints raw values in hex without a 0x prefix
};

/**
 * @brief Field values of one drive section exactly as the report spells them.
 *
 * Empty strings mean "not reported". The RecordNormalizer turns this into a
 * CanonicalDriveRecord.
 */
struct RawDriveRecord {
    std::string source_file_name;
    ReportFormat source_format = ReportFormat::Unsupported;
    std::size_t index = 0;       ///< Section position within the file
    std::string location;        ///< Offset hint for errors ("line 12", "page 1")
    std::string encoding;        ///< Text encoding of the source

    std::string serial;
    std::string model;
    std::string vendor_information;
    std::string firmware;
    std::string interface;
    std::string capacity;
    std::string health;          ///< Health line (score and/or vocabulary)
    std::string status;          ///< Overall status or self-assessment verdict
    std::string temperature;
    std::string power_on;
    std::string reallocated;
    std::string grown_defects;
    std::string report_date;
    std::vector<RawSmartRow> smart_rows;

    std::string excerpt;         ///< Bounded slice of the section source
};

/**
 * @brief Sections and errors produced from one source file.
 */
struct ExtractionResult {
    std::vector<RawDriveRecord> records;
    std::vector<ParseError> errors;
};

/**
 * @brief Interface for a report dialect extractor.
 *
 * Implementations are stateless: extract() may run concurrently on
 * different buffers. Content problems are reported through
 * ExtractionResult::errors, never by throwing; exceptions escaping extract()
 * indicate resource failures (e.g. std::bad_alloc).
 */
class IExtractor {
public:
    virtual ~IExtractor() = default;

    /// @return Human-readable name (e.g. "HTML").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The sniffed format this extractor handles.
    [[nodiscard]] virtual ReportFormat format() const noexcept = 0;

    /**
     * @brief Extract drive sections from one file.
     * @param data File contents.
     * @param file_name Name recorded as source of every record and error.
     */
    [[nodiscard]] virtual ExtractionResult extract(std::span<const unsigned char> data,
                                                   const std::string& file_name) const = 0;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_EXTRACTOR_HPP
