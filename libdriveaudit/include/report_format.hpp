/**
 * @file report_format.hpp
 * @brief Classification of an input buffer as one of the known report dialects.
 */

#ifndef DRIVEAUDIT_REPORT_FORMAT_HPP
#define DRIVEAUDIT_REPORT_FORMAT_HPP

#include <string_view>

namespace driveaudit {

/**
 * @brief The closed set of classifications the FormatSniffer can return.
 *
 * Html, Text and Pdf select an extractor; Zip selects the ArchiveExpander.
 */
enum class ReportFormat {
    Html,
    Text,
    Pdf,
    Zip,
    Unsupported
};

/**
 * @brief Upper-case name used in logs, error rows and CSV exports.
 */
constexpr std::string_view to_string(const ReportFormat format) noexcept {
    switch (format) {
        case ReportFormat::Html:        return "HTML";
        case ReportFormat::Text:        return "TEXT";
        case ReportFormat::Pdf:         return "PDF";
        case ReportFormat::Zip:         return "ZIP";
        case ReportFormat::Unsupported: return "UNSUPPORTED";
    }
    return "UNSUPPORTED";
}

/**
 * @brief Rank used when two records of one drive disagree: PDF > HTML > TEXT.
 *
 * Higher wins. Zip and Unsupported never carry records.
 */
constexpr int source_precedence(const ReportFormat format) noexcept {
    switch (format) {
        case ReportFormat::Pdf:  return 3;
        case ReportFormat::Html: return 2;
        case ReportFormat::Text: return 1;
        default:                 return 0;
    }
}

} // namespace driveaudit

#endif // DRIVEAUDIT_REPORT_FORMAT_HPP
