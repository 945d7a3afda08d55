#include "../../include/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace driveaudit {

namespace {

bool is_space(const unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// length of a whitespace sequence at the front of s (ASCII or U+00A0)
std::size_t leading_space_len(const std::string_view s) {
    if (s.empty()) return 0;
    if (is_space(static_cast<unsigned char>(s[0]))) return 1;
    if (s.size() >= 2 && static_cast<unsigned char>(s[0]) == 0xC2 && static_cast<unsigned char>(s[1]) == 0xA0) return 2;
    return 0;
}

std::size_t trailing_space_len(const std::string_view s) {
    if (s.empty()) return 0;
    if (is_space(static_cast<unsigned char>(s.back()))) return 1;
    if (s.size() >= 2 && static_cast<unsigned char>(s[s.size() - 2]) == 0xC2 &&
        static_cast<unsigned char>(s.back()) == 0xA0) return 2;
    return 0;
}

} // namespace

std::string to_lower_copy(const std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string to_upper_copy(const std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    while (const std::size_t n = leading_space_len(s)) s.remove_prefix(n);
    while (const std::size_t n = trailing_space_len(s)) s.remove_suffix(n);
    return s;
}

std::string collapse_whitespace(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    std::string_view rest = trim(s);
    while (!rest.empty()) {
        if (const std::size_t n = leading_space_len(rest)) {
            pending_space = true;
            rest.remove_prefix(n);
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(rest.front());
        rest.remove_prefix(1);
    }
    return out;
}

bool icontains(const std::string_view haystack, const std::string_view needle) noexcept {
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;
    for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        bool match = true;
        for (std::size_t k = 0; k < needle.size(); ++k) {
            if (std::tolower(static_cast<unsigned char>(haystack[i + k])) !=
                std::tolower(static_cast<unsigned char>(needle[k]))) {
                match = false;
                break;
            }
        }
        if (match) return true;
    }
    return false;
}

std::vector<std::string_view> split_lines(const std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        if (end == text.size()) break;
        start = end + 1;
    }
    return lines;
}

std::vector<std::string> split_columns(const std::string_view line) {
    std::vector<std::string> cells;
    std::string current;
    std::size_t i = 0;
    auto flush = [&] {
        const auto t = trim(current);
        if (!t.empty()) cells.emplace_back(t);
        current.clear();
    };
    while (i < line.size()) {
        const char c = line[i];
        if (c == '\t') {
            flush();
            ++i;
        } else if (c == ' ' && i + 1 < line.size() && line[i + 1] == ' ') {
            flush();
            while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        } else {
            current.push_back(c);
            ++i;
        }
    }
    flush();
    return cells;
}

std::string_view first_column(std::string_view value) noexcept {
    value = trim(value);
    const std::size_t tab = value.find('\t');
    const std::size_t gap = value.find("  ");
    const std::size_t cut = std::min(tab, gap);
    if (cut != std::string_view::npos) value = value.substr(0, cut);
    return trim(value);
}

std::string bounded_copy(const std::string_view text, const std::size_t max_bytes) {
    if (text.size() <= max_bytes) return std::string(text);
    std::size_t cut = max_bytes;
    // back off continuation bytes so a multi-byte character is never split
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return std::string(text.substr(0, cut));
}

} // namespace driveaudit
