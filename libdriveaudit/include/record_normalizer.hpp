/**
 * @file record_normalizer.hpp
 * @brief Coerces raw extractor output into CanonicalDriveRecord.
 */

#ifndef DRIVEAUDIT_RECORD_NORMALIZER_HPP
#define DRIVEAUDIT_RECORD_NORMALIZER_HPP

#include "drive_record.hpp"
#include "extractor.hpp"
#include "parse_error.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace driveaudit {

/**
 * @brief Turns a RawDriveRecord into a CanonicalDriveRecord.
 *
 * @details Values that can't be normalized become UNKNOWN or absent. The
 * only field whose absence is an error is the serial number: a record
 * without a usable serial comes back as MISSING_REQUIRED_FIELD.
 *
 * The static helpers are the individual coercions, usable on their own.
 */
class RecordNormalizer {
public:
    /**
     * @param reference_time extracted_at for records whose report carries no
     *        parsable date.
     */
    explicit RecordNormalizer(Timestamp reference_time = Timestamp{});

    [[nodiscard]] std::variant<CanonicalDriveRecord, ParseError> normalize(const RawDriveRecord& raw) const;

    [[nodiscard]] Timestamp reference_time() const noexcept { return reference_time_; }

    /**
     * @brief Serial cleanup: whitespace removed, upper case, "TOTALSIZE"
     * removed, a trailing run of a repeated 4-character group trimmed when
     * at least 8 characters remain.
     * @return Empty when the value is not a usable serial.
     */
    static std::string normalize_serial(std::string_view raw);

    static InterfaceType parse_interface(std::string_view text);

    /// Bytes; 0 when nothing parsable. KB/MB/GB/TB are decimal, KiB/MiB/GiB/TiB binary.
    static std::uint64_t parse_capacity(std::string_view text);

    /**
     * @brief Overall verdict from the status and health lines.
     *
     * Vocabulary wins over a score: the status line is checked first, then
     * the health line, failures before warnings before passes. Without
     * vocabulary, a health score of 70 or more is PASS, 30 to 69 WARN,
     * below 30 FAIL.
     */
    static HealthVerdict parse_health(std::string_view status, std::string_view health);

    /// First integer 0..100 on the health line.
    static std::optional<unsigned> parse_health_percent(std::string_view health);

    /// Celsius; Fahrenheit is converted. Values outside -40..150 C are discarded.
    static std::optional<int> parse_temperature(std::string_view text);

    /// "1134 days, 6 hours", "2 years 10 days", "18432 h" or a bare number of hours.
    static std::optional<std::uint64_t> parse_power_on_hours(std::string_view text);

    /// First integer in @p text, thousands separators allowed.
    static std::optional<std::uint64_t> parse_count(std::string_view text);

    /**
     * @brief Raw SMART value, masked to the meaningful bits of attribute @p id.
     *
     * A 0x prefix, @p hex_hint, or hex letters select base 16; otherwise the
     * leading decimal number is used. Temperatures (190, 194) keep the low
     * byte, power-on hours (9) the low 32 bits, everything else 48 bits.
     */
    static std::optional<std::uint64_t> parse_smart_raw(unsigned id, std::string_view raw, bool hex_hint);

    static AttributeStatus parse_attribute_status(std::string_view text,
                                                  std::optional<unsigned> value,
                                                  std::optional<unsigned> threshold);

    /// UTC timestamp from one of the date formats reports use.
    static std::optional<Timestamp> parse_timestamp(std::string_view text);

private:
    Timestamp reference_time_;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_RECORD_NORMALIZER_HPP
