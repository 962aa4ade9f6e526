#pragma once

#include "calendar.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace pocket {

// ============================================================================
// Reminder eligibility - when the single daily reminder may fire
// ============================================================================
//
// Pure functions over their inputs. Two separate rules are kept apart:
// - spacing: at least `minimum_spacing` of absolute time between deliveries,
//   measured on UTC instants only
// - daily cap: at most one delivery per local calendar day, keyed on the
//   "YYYY-MM-DD" local date string
// Neither rule is derived from the other, so a device time zone change can
// neither double-deliver nor starve the reminder.

constexpr std::chrono::hours min_reminder_spacing{12};

enum class reminder_gate_reason {
    ok,
    disabled,
    permission_denied,
    spacing_not_elapsed,
    same_local_day,
    inside_quiet_hours
};

const char* to_string(reminder_gate_reason reason) noexcept;

struct reminder_gate_input {
    timestamp_t now;
    bool reminders_enabled = false;
    bool permission_granted = false;
    std::optional<timestamp_t> last_delivered_at_utc;
    std::optional<std::string> last_delivered_local_date;
    std::optional<time_of_day> quiet_hours_start;
    std::optional<time_of_day> quiet_hours_end;
    std::chrono::milliseconds minimum_spacing = min_reminder_spacing;
};

struct reminder_gate_result {
    bool allowed = false;
    reminder_gate_reason reason = reminder_gate_reason::ok;
};

/// Decide whether a reminder may be shown right now. Checks run in order and
/// stop at the first failure: disabled, permission_denied,
/// spacing_not_elapsed, same_local_day, inside_quiet_hours.
reminder_gate_result evaluate_reminder_delivery_gate(const reminder_gate_input& input) noexcept;

struct reminder_eligibility_input {
    timestamp_t now;
    time_of_day preferred_time_local;
    std::optional<time_of_day> quiet_hours_start;
    std::optional<time_of_day> quiet_hours_end;
    std::optional<timestamp_t> last_delivered_at_utc;
    std::optional<std::string> last_delivered_local_date;
    std::chrono::milliseconds minimum_spacing = min_reminder_spacing;
};

struct reminder_eligibility_result {
    timestamp_t candidate_local;
    std::string candidate_utc;         // ISO-8601, "Z" suffix
    std::string candidate_local_date;  // YYYY-MM-DD, the daily cap key
    bool minimum_spacing_applied = false;
    bool daily_gate_applied = false;
    bool quiet_hours_adjusted = false;
};

/// Next instant a reminder may be scheduled for.
///
/// Starts from the next occurrence of the preferred time strictly after
/// `now`. If that is earlier than the spacing floor (last delivery plus
/// `minimum_spacing`), it moves to the first preferred-time occurrence at or
/// after the floor, never to the bare floor. A candidate inside quiet hours
/// moves to the end of the quiet window. A candidate on the last delivered
/// local date moves to the next day's preferred time, re-applying spacing
/// and quiet hours, at most 10 times.
///
/// Throws std::invalid_argument only when a local time cannot be represented.
reminder_eligibility_result compute_next_eligible_reminder(const reminder_eligibility_input& input);

/// True when the local time of `instant` falls inside [start, end). The
/// window wraps midnight when start > end. A missing bound, or start == end,
/// means no quiet hours.
bool is_inside_quiet_hours(timestamp_t instant,
                           const std::optional<time_of_day>& start,
                           const std::optional<time_of_day>& end);

} // namespace pocket
