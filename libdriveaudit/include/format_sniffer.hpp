/**
 * @file format_sniffer.hpp
 * @brief Content-based classification of input buffers.
 */

#ifndef DRIVEAUDIT_FORMAT_SNIFFER_HPP
#define DRIVEAUDIT_FORMAT_SNIFFER_HPP

#include "report_format.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace driveaudit {

    /**
     * @brief Classifies a buffer as HTML, TEXT, PDF, ZIP or UNSUPPORTED.
     *
     * Decision order:
     * 1. magic signatures (ZIP local-file or end-of-central-directory header,
     *    "%PDF-" within the first KiB);
     * 2. the libmagic MIME type, which rejects binary payloads (images,
     *    executables, other archives) and confirms zip/pdf;
     * 3. markers in the decoded text: HTML tags against the section headers of
     *    the plain-text diagnostic dialects.
     *
     * The file name is only a hint: it breaks the tie when a text report
     * embeds HTML markup and never overrides content.
     */
    class FormatSniffer {
    public:
        /// Bytes of a buffer inspected for text markers.
        static constexpr std::size_t kSniffWindow = 1024 * 1024;

        /**
         * @brief Classify a buffer. Never throws.
         * @param data Buffer contents (or its first kSniffWindow bytes).
         * @param file_name_hint Original name, may be empty.
         */
        static ReportFormat sniff(std::span<const unsigned char> data,
                                  std::string_view file_name_hint = {}) noexcept;

        /**
         * @brief MIME type of a buffer according to libmagic.
         * @return The MIME type, or an empty string when libmagic is unavailable.
         */
        static std::string detect_mime(std::span<const unsigned char> data);
    };

} // namespace driveaudit

#endif // DRIVEAUDIT_FORMAT_SNIFFER_HPP
