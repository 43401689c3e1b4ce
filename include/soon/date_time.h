/**
 * @file date_time.h
 * @brief UTC instant with millisecond precision and ISO-8601 conversion
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace soon {

/**
 * @brief Point in time stored as milliseconds since the Unix epoch (UTC)
 *
 * A DateTime may be invalid (see invalid()); such values exist so callers can
 * represent an unparsable date, but the serializer refuses to write them.
 */
class DateTime {
public:
    DateTime() = default;
    explicit DateTime(int64_t epoch_ms) : epoch_ms_(epoch_ms) {}

    static DateTime invalid();
    static DateTime from_time_point(std::chrono::system_clock::time_point tp);

    /**
     * @brief Build from calendar fields (UTC)
     * @return nullopt if any field is out of range (month 13, Feb 30, ...)
     */
    static std::optional<DateTime> from_fields(int year, int month, int day,
                                               int hour = 0, int minute = 0,
                                               int second = 0, int millisecond = 0);

    /**
     * @brief Parse an ISO-8601 literal
     *
     * Accepts YYYY-MM-DD, optionally followed by THH:MM, :SS, a fraction
     * and Z or +HH:MM / -HH:MM. A missing zone means UTC. Fractions beyond
     * milliseconds are truncated.
     *
     * @return nullopt if the text is not date-shaped or names no valid instant
     */
    static std::optional<DateTime> parse(const std::string& text);

    bool is_valid() const { return valid_; }
    int64_t epoch_ms() const { return epoch_ms_; }
    std::chrono::system_clock::time_point time_point() const;

    /// Calendar year (UTC) of the instant
    int year() const;

    /// Canonical YYYY-MM-DDTHH:MM:SS.sssZ form; empty for invalid dates
    std::string to_iso_string() const;

    bool operator==(const DateTime& other) const {
        return valid_ == other.valid_ && (!valid_ || epoch_ms_ == other.epoch_ms_);
    }
    bool operator!=(const DateTime& other) const { return !(*this == other); }

private:
    int64_t epoch_ms_ = 0;
    bool valid_ = true;
};

/**
 * @brief Length of the ISO-8601 date shape starting at @p pos
 *
 * Matches \d{4}-\d{2}-\d{2}(T\d{2}:\d{2}(:\d{2})?(\.\d+)?(Z|[+-]\d{2}:\d{2})?)?
 * without checking what follows or whether the fields are in range.
 *
 * @return Number of bytes matched, 0 if there is no date at @p pos
 */
size_t match_iso8601(const std::string& text, size_t pos = 0);

} // namespace soon
