/**
 * @file html_extractor.hpp
 * @brief Extractor for HTML diagnostic reports, built on gumbo.
 */

#ifndef DRIVEAUDIT_HTML_EXTRACTOR_HPP
#define DRIVEAUDIT_HTML_EXTRACTOR_HPP

#include "extractor.hpp"

namespace driveaudit {

/**
 * @brief Implements IExtractor for HTML reports.
 *
 * @details The document is parsed with gumbo and flattened into labeled
 * lines: two-cell table rows become "label : value", wider rows keep their
 * cells separated by column gaps so SMART tables survive. Drive sections are
 * then located by the first strategy that finds any:
 * 1. elements whose class or id names a drive, disk or hdd;
 * 2. headings that mention a disk or drive;
 * 3. the boundary markers used by plain-text reports;
 * 4. the whole document, when it carries exactly one serial number.
 *
 * A section without a serial number or without any health or status value
 * yields MISSING_REQUIRED_FIELD. A document with no recognizable section
 * yields MALFORMED_CONTENT.
 */
class HtmlExtractor final : public IExtractor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "HTML";
    }

    [[nodiscard]] ReportFormat format() const noexcept override {
        return ReportFormat::Html;
    }

    [[nodiscard]] ExtractionResult extract(std::span<const unsigned char> data,
                                           const std::string& file_name) const override;

    /**
     * @brief Flatten an HTML document into the line form the field matcher reads.
     * Exposed for tests.
     */
    [[nodiscard]] static std::string flatten(std::string_view html);
};

} // namespace driveaudit

#endif // DRIVEAUDIT_HTML_EXTRACTOR_HPP
