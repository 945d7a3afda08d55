#include "../../include/parse_error.hpp"

namespace driveaudit {

std::string_view to_string(const ErrorReason reason) noexcept {
    switch (reason) {
        case ErrorReason::UnsupportedFormat:          return "UNSUPPORTED_FORMAT";
        case ErrorReason::MalformedContent:           return "MALFORMED_CONTENT";
        case ErrorReason::MissingRequiredField:       return "MISSING_REQUIRED_FIELD";
        case ErrorReason::ArchiveCorrupt:             return "ARCHIVE_CORRUPT";
        case ErrorReason::NestedArchiveDepthExceeded: return "NESTED_ARCHIVE_DEPTH_EXCEEDED";
    }
    return "UNKNOWN";
}

ParseError::ParseError(std::string file_name,
                       const ReportFormat format_guess,
                       const ErrorReason reason,
                       std::string detail,
                       std::optional<std::string> offset_hint,
                       std::vector<std::string> encodings_tried)
    : file_name_(std::move(file_name)),
      format_guess_(format_guess),
      reason_(reason),
      detail_(std::move(detail)),
      offset_hint_(std::move(offset_hint)),
      encodings_tried_(std::move(encodings_tried)) {}

std::string ParseError::describe() const {
    std::string out = file_name_;
    out += " [";
    out += to_string(reason_);
    out += "] ";
    out += detail_;
    if (offset_hint_) {
        out += " (" + *offset_hint_ + ")";
    }
    return out;
}

} // namespace driveaudit
