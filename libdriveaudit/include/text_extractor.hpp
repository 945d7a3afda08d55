/**
 * @file text_extractor.hpp
 * @brief Extractor for plain-text diagnostic reports.
 */

#ifndef DRIVEAUDIT_TEXT_EXTRACTOR_HPP
#define DRIVEAUDIT_TEXT_EXTRACTOR_HPP

#include "extractor.hpp"

namespace driveaudit {

/**
 * @brief Implements IExtractor for plain-text reports.
 *
 * @details The bytes are decoded with decode_text() and split at drive
 * boundary markers. Each block yields one RawDriveRecord; a block without a
 * serial number yields a MISSING_REQUIRED_FIELD error instead. A report date
 * found before the first boundary applies to every block that lacks one.
 */
class TextExtractor final : public IExtractor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "TEXT";
    }

    [[nodiscard]] ReportFormat format() const noexcept override {
        return ReportFormat::Text;
    }

    [[nodiscard]] ExtractionResult extract(std::span<const unsigned char> data,
                                           const std::string& file_name) const override;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_TEXT_EXTRACTOR_HPP
