/**
 * @file text_decoder.hpp
 * @brief Decodes report bytes into UTF-8 with an ordered encoding fallback.
 */

#ifndef DRIVEAUDIT_TEXT_DECODER_HPP
#define DRIVEAUDIT_TEXT_DECODER_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

/**
 * @brief Result of decoding a byte buffer.
 */
struct DecodedText {
    std::string text;                         ///< UTF-8, BOM removed
    std::string encoding;                     ///< Encoding that succeeded
    std::vector<std::string> encodings_tried; ///< In attempt order, including the one that succeeded
};

/**
 * @brief Decode report bytes.
 *
 * Attempts, in order: "utf-8" (strict), "utf-16le"/"utf-16be" (only when a
 * byte order mark is present) and "windows-1252". The last one never fails:
 * the five byte values windows-1252 leaves undefined map to their Latin-1
 * code points.
 */
DecodedText decode_text(std::span<const unsigned char> bytes);

/**
 * @brief Strict UTF-8 validation (no overlongs, no surrogates, max U+10FFFF).
 */
bool is_valid_utf8(std::string_view bytes) noexcept;

} // namespace driveaudit

#endif // DRIVEAUDIT_TEXT_DECODER_HPP
