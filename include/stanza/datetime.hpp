#pragma once


/*
    -------------------------------------------
    Stanza date and time values - ISO-8601 I/O
    -------------------------------------------
    JSON has no date type; Stanza writes and reads dates as ISO-8601 text:

        Date          2024-03-01T12:30:00Z
        Timestamp     2024-03-01T12:30:00.250000Z
        TimestampTz   2024-03-01T14:30:00.250000+02:00

    `parse_iso8601` accepts `YYYY-MM-DDTHH:MM:SS`, an optional fraction of
    1 to 9 digits, and an optional `Z` or `+HH:MM` / `-HH:MM` suffix.
    Text without a suffix is taken as UTC
*/

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"

namespace Stanza {

    using Date = std::chrono::sys_seconds;
    using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

    /// @brief A point in time together with the UTC offset it was observed in.
    struct TimestampTz {
        Timestamp utc{};                 ///< The instant, in UTC.
        std::chrono::minutes offset{};   ///< Offset of the local wall clock from UTC.

        bool operator==(const TimestampTz&) const = default;
    };

    STANZA_API std::string format_iso8601(Date d);
    STANZA_API std::string format_iso8601(Timestamp ts);
    STANZA_API std::string format_iso8601(const TimestampTz& ts);

    /// @brief Parses ISO-8601 date-time text; `std::nullopt` if it does not match.
    [[nodiscard]] STANZA_API std::optional<TimestampTz> parse_iso8601(std::string_view text);

    /// @brief Parses an offset written as `Z`, `UTC`, `+HH:MM` or `-HH:MM`.
    [[nodiscard]] STANZA_API std::optional<std::chrono::minutes> parse_utc_offset(std::string_view text);

} // namespace Stanza
