/**
 * @file pdf_extractor.hpp
 * @brief Extractor for PDF diagnostic reports, built on qpdf.
 */

#ifndef DRIVEAUDIT_PDF_EXTRACTOR_HPP
#define DRIVEAUDIT_PDF_EXTRACTOR_HPP

#include "extractor.hpp"

namespace driveaudit {

/**
 * @brief Implements IExtractor for PDF reports.
 *
 * @details Pages are enumerated with qpdf and their content streams are
 * tokenized. Text-showing operators are tracked through the text and
 * graphics matrices so each string lands at a page position; strings are
 * then clustered into rows by baseline and ordered left to right, with
 * column gaps preserved. The rebuilt text goes through the same field
 * matching as plain-text reports.
 *
 * A page whose content can't be parsed, or that places text at a
 * non-finite position, yields MALFORMED_CONTENT for that page while the
 * other pages are still read. A document that can't be opened, or that has
 * no text at all, yields MALFORMED_CONTENT for the file.
 */
class PdfExtractor final : public IExtractor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "PDF";
    }

    [[nodiscard]] ReportFormat format() const noexcept override {
        return ReportFormat::Pdf;
    }

    [[nodiscard]] ExtractionResult extract(std::span<const unsigned char> data,
                                           const std::string& file_name) const override;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_PDF_EXTRACTOR_HPP
