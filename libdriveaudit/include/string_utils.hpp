#ifndef DRIVEAUDIT_STRING_UTILS_HPP
#define DRIVEAUDIT_STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

    /// ASCII lower-case copy; bytes >= 0x80 are left untouched.
    std::string to_lower_copy(std::string_view s);

    /// ASCII upper-case copy; bytes >= 0x80 are left untouched.
    std::string to_upper_copy(std::string_view s);

    /// Strip ASCII whitespace (and NBSP as UTF-8) from both ends.
    std::string_view trim(std::string_view s) noexcept;

    /// Trim and replace every whitespace run with one space.
    std::string collapse_whitespace(std::string_view s);

    /// Case-insensitive (ASCII) substring test.
    bool icontains(std::string_view haystack, std::string_view needle) noexcept;

    /**
     * @brief Split on '\n', dropping a trailing '\r' from each line.
     * The views point into @p text.
     */
    std::vector<std::string_view> split_lines(std::string_view text);

    /**
     * @brief Split a table row into cells on tabs or runs of two or more spaces.
     * Empty cells are dropped; each cell is trimmed.
     */
    std::vector<std::string> split_columns(std::string_view line);

    /// Cut a value at its first column gap (tab or two spaces) and trim it.
    std::string_view first_column(std::string_view value) noexcept;

    /// At most @p max_bytes of @p text, shortened to a UTF-8 character boundary.
    std::string bounded_copy(std::string_view text, std::size_t max_bytes);

} // namespace driveaudit

#endif // DRIVEAUDIT_STRING_UTILS_HPP
