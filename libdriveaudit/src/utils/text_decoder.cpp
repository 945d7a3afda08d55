#include "../../include/text_decoder.hpp"
#include <array>
#include <cstdint>

namespace driveaudit {

namespace {

// windows-1252 code points for 0x80..0x9F; zero marks the undefined slots
constexpr std::array<std::uint16_t, 32> kCp1252High = {
    0x20AC, 0x0000, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x0000, 0x017D, 0x0000,
    0x0000, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x0000, 0x017E, 0x0000,
};

void append_utf8(std::string& out, const char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string decode_utf16(std::span<const unsigned char> bytes, const bool little_endian) {
    std::string out;
    out.reserve(bytes.size());
    auto unit_at = [&](const std::size_t i) -> char16_t {
        return little_endian
            ? static_cast<char16_t>(bytes[i] | (bytes[i + 1] << 8))
            : static_cast<char16_t>((bytes[i] << 8) | bytes[i + 1]);
    };
    std::size_t i = 0;
    while (i + 1 < bytes.size()) {
        char32_t cp = unit_at(i);
        i += 2;
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < bytes.size()) {
            const char32_t low = unit_at(i);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                i += 2;
            } else {
                cp = 0xFFFD;
            }
        } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;
        }
        append_utf8(out, cp);
    }
    return out;
}

std::string decode_cp1252(std::span<const unsigned char> bytes) {
    std::string out;
    out.reserve(bytes.size() + bytes.size() / 8);
    for (const unsigned char b : bytes) {
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
        } else if (b < 0xA0 && kCp1252High[b - 0x80] != 0) {
            append_utf8(out, kCp1252High[b - 0x80]);
        } else {
            append_utf8(out, b);
        }
    }
    return out;
}

} // namespace

bool is_valid_utf8(const std::string_view bytes) noexcept {
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t len;
        char32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += len;
    }
    return true;
}

DecodedText decode_text(std::span<const unsigned char> bytes) {
    DecodedText result;

    result.encodings_tried.emplace_back("utf-8");
    std::span<const unsigned char> body = bytes;
    if (body.size() >= 3 && body[0] == 0xEF && body[1] == 0xBB && body[2] == 0xBF) {
        body = body.subspan(3);
    }
    const std::string_view view(reinterpret_cast<const char*>(body.data()), body.size());
    if (is_valid_utf8(view)) {
        result.text.assign(view);
        result.encoding = "utf-8";
        return result;
    }

    if (bytes.size() >= 2 && ((bytes[0] == 0xFF && bytes[1] == 0xFE) || (bytes[0] == 0xFE && bytes[1] == 0xFF))) {
        const bool le = bytes[0] == 0xFF;
        result.encoding = le ? "utf-16le" : "utf-16be";
        result.encodings_tried.push_back(result.encoding);
        result.text = decode_utf16(bytes.subspan(2), le);
        return result;
    }

    result.encodings_tried.emplace_back("windows-1252");
    result.encoding = "windows-1252";
    result.text = decode_cp1252(bytes);
    return result;
}

} // namespace driveaudit
