#pragma once

#include "types.hpp"
#include <chrono>
#include <compare>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace pocket {

// ============================================================================
// Calendar - local dates, times of day and instant conversions
// ============================================================================
//
// Local views are computed through the process time zone (TZ), the same way
// the device clock is read. Nothing here caches an offset, so a time zone
// change between calls is picked up by the next call.

/// A local calendar day. Serialized as "YYYY-MM-DD", which also sorts
/// correctly as text.
struct local_date {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    /// Accepts "YYYY-MM-DD" or any ISO date-time that starts with one.
    /// Throws std::invalid_argument on anything else.
    static local_date parse(std::string_view text);
    static local_date from_ymd(std::chrono::year_month_day ymd);

    std::chrono::year_month_day ymd() const;
    std::string to_string() const;

    local_date add_days(int days) const;

    /// Calendar-month step. The day is `preferred_day` (or the current day if
    /// zero), clamped to the length of the target month.
    local_date add_months(int months, unsigned preferred_day = 0) const;
    local_date add_years(int years, unsigned preferred_day = 0) const;

    auto operator<=>(const local_date&) const = default;
};

/// Wall-clock time of day, minute resolution.
struct time_of_day {
    int hours = 0;
    int minutes = 0;

    /// "HH:MM", 00:00 through 23:59. Throws std::invalid_argument.
    static time_of_day parse(std::string_view text);

    int minutes_of_day() const { return hours * 60 + minutes; }
    std::string to_string() const;

    bool operator==(const time_of_day&) const = default;
};

std::tm to_local_tm(timestamp_t instant);

local_date local_date_of(timestamp_t instant);
time_of_day local_time_of(timestamp_t instant);

/// The instant at which the local wall clock reads `time` on `date`.
/// Wall times skipped by a DST transition resolve the way mktime() does.
timestamp_t at_local_time(const local_date& date, const time_of_day& time);

/// Local midnight that starts `date`.
timestamp_t start_of_local_day(const local_date& date);

/// "YYYY-MM-DD" in local time. Used only as a day bucket key.
std::string format_local_date(timestamp_t instant);

/// "YYYY-MM-DDTHH:MM:SS.sssZ"
std::string format_iso_utc(timestamp_t instant);

/// Parses "YYYY-MM-DDTHH:MM[:SS[.fff]]" followed by "Z" or "+HH:MM"/"-HH:MM".
/// Returns nullopt for anything unparseable.
std::optional<timestamp_t> parse_iso_utc(std::string_view text);

} // namespace pocket
