/**
 * @file drive_record.hpp
 * @brief The canonical drive-health record every dialect is normalized into.
 */

#ifndef DRIVEAUDIT_DRIVE_RECORD_HPP
#define DRIVEAUDIT_DRIVE_RECORD_HPP

#include "report_format.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace driveaudit {

/// Seconds since the Unix epoch, UTC.
using Timestamp = std::chrono::sys_seconds;

/// Upper bound for CanonicalDriveRecord::raw_excerpt, in bytes.
inline constexpr std::size_t kMaxRawExcerpt = 512;

enum class InterfaceType {
    Sata,
    Sas,
    Nvme,
    Unknown
};

enum class HealthVerdict {
    Pass,
    Warn,
    Fail,
    Unknown
};

enum class AttributeStatus {
    Ok,
    Warning,
    Failing,
    Unknown
};

/**
 * @brief One SMART attribute after base and unit normalization.
 *
 * raw_value is already masked to the bits that carry meaning for the
 * attribute id (e.g. the low byte of 194), so values from hex and decimal
 * dialects compare equal.
 */
struct SmartAttribute {
    unsigned id = 0;
    std::string name;
    std::optional<std::uint64_t> raw_value;
    std::optional<unsigned> normalized_value;
    std::optional<unsigned> worst;
    std::optional<unsigned> threshold;
    AttributeStatus status = AttributeStatus::Unknown;

    bool operator==(const SmartAttribute&) const = default;
};

/**
 * @brief A drive as reported by one section of one source file.
 *
 * serial_number is never empty: sections without a usable serial are
 * reported as ParseError instead of producing a record.
 */
struct CanonicalDriveRecord {
    std::string serial_number;       ///< Identity key: no whitespace, upper case
    std::string label_serial;        ///< First 8 characters of the serial, as printed on labels
    std::string model;
    std::string vendor;              ///< Derived from the model prefix, "Unknown" if none matches
    std::string vendor_information;  ///< The report's own vendor line, whitespace collapsed
    std::string firmware_revision;
    InterfaceType interface_type = InterfaceType::Unknown;
    std::uint64_t capacity_bytes = 0; ///< 0 when the report carries no parsable capacity
    HealthVerdict overall_health = HealthVerdict::Unknown;
    std::optional<unsigned> health_percent;
    std::optional<int> temperature_celsius;
    std::optional<std::uint64_t> power_on_hours;
    std::optional<std::uint64_t> reallocated_sectors;
    std::optional<std::uint64_t> grown_defects;
    std::map<unsigned, SmartAttribute> smart_attributes; ///< Keyed by attribute id

    std::string source_file_name;    ///< Input name, "outer.zip/inner.html" for archive members
    ReportFormat source_format = ReportFormat::Unsupported;
    std::size_t source_index = 0;    ///< Position of the section within its source file
    std::string source_encoding;
    Timestamp extracted_at{};
    std::string raw_excerpt;         ///< At most kMaxRawExcerpt bytes of the section source

    bool operator==(const CanonicalDriveRecord&) const = default;
};

constexpr std::string_view to_string(const InterfaceType type) noexcept {
    switch (type) {
        case InterfaceType::Sata:    return "SATA";
        case InterfaceType::Sas:     return "SAS";
        case InterfaceType::Nvme:    return "NVMe";
        case InterfaceType::Unknown: return "unknown";
    }
    return "unknown";
}

constexpr std::string_view to_string(const HealthVerdict verdict) noexcept {
    switch (verdict) {
        case HealthVerdict::Pass:    return "PASS";
        case HealthVerdict::Warn:    return "WARN";
        case HealthVerdict::Fail:    return "FAIL";
        case HealthVerdict::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

constexpr std::string_view to_string(const AttributeStatus status) noexcept {
    switch (status) {
        case AttributeStatus::Ok:      return "OK";
        case AttributeStatus::Warning: return "WARNING";
        case AttributeStatus::Failing: return "FAILING";
        case AttributeStatus::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

} // namespace driveaudit

#endif // DRIVEAUDIT_DRIVE_RECORD_HPP
