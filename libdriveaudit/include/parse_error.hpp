/**
 * @file parse_error.hpp
 * @brief Recoverable extraction errors and the fatal resource-exhaustion failure.
 *
 * A ParseError describes one file, member, section or page that could not
 * produce a record. It is a value collected into the batch result; sibling
 * work continues. ResourceExhaustedError is the only failure that aborts a
 * batch, and it is thrown rather than collected.
 */

#ifndef DRIVEAUDIT_PARSE_ERROR_HPP
#define DRIVEAUDIT_PARSE_ERROR_HPP

#include "report_format.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

enum class ErrorReason {
    UnsupportedFormat,
    MalformedContent,
    MissingRequiredField,
    ArchiveCorrupt,
    NestedArchiveDepthExceeded
};

std::string_view to_string(ErrorReason reason) noexcept;

/**
 * @brief Immutable description of a non-fatal extraction failure.
 */
class ParseError {
public:
    /**
     * @param file_name Input or member name the error belongs to.
     * @param format_guess What the sniffer classified the content as.
     * @param reason Error category.
     * @param detail Human-readable explanation.
     * @param offset_hint Where in the source the problem sits ("line 12", "page 2", "section 3").
     * @param encodings_tried Text encodings attempted before the failure, for content errors.
     */
    ParseError(std::string file_name,
               ReportFormat format_guess,
               ErrorReason reason,
               std::string detail,
               std::optional<std::string> offset_hint = std::nullopt,
               std::vector<std::string> encodings_tried = {});

    [[nodiscard]] const std::string& file_name() const noexcept { return file_name_; }
    [[nodiscard]] ReportFormat format_guess() const noexcept { return format_guess_; }
    [[nodiscard]] ErrorReason reason() const noexcept { return reason_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] const std::optional<std::string>& offset_hint() const noexcept { return offset_hint_; }
    [[nodiscard]] const std::vector<std::string>& encodings_tried() const noexcept { return encodings_tried_; }

    /// One-line rendering for logs: "name [REASON] detail (hint)".
    [[nodiscard]] std::string describe() const;

    bool operator==(const ParseError&) const = default;

private:
    std::string file_name_;
    ReportFormat format_guess_;
    ErrorReason reason_;
    std::string detail_;
    std::optional<std::string> offset_hint_;
    std::vector<std::string> encodings_tried_;
};

/**
 * @brief Thrown when a batch would exceed a resource bound (archive bomb, byte cap).
 *
 * Propagates out of BatchOrchestrator::run; no partial result is returned.
 */
class ResourceExhaustedError : public std::runtime_error {
public:
    ResourceExhaustedError(const std::string& what_arg, std::string file_name)
        : std::runtime_error(what_arg), file_name_(std::move(file_name)) {}

    /// Input that triggered the bound.
    [[nodiscard]] const std::string& file_name() const noexcept { return file_name_; }

private:
    std::string file_name_;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_PARSE_ERROR_HPP
