#include "pocket/reminder.hpp"

namespace pocket {

namespace {

struct quiet_window {
    int start;
    int end;

    bool wraps() const { return start > end; }

    bool contains(int minute_of_day) const {
        if (!wraps()) {
            return minute_of_day >= start && minute_of_day < end;
        }
        return minute_of_day >= start || minute_of_day < end;
    }
};

std::optional<quiet_window> make_quiet_window(const std::optional<time_of_day>& start,
                                              const std::optional<time_of_day>& end) {
    if (!start || !end) return std::nullopt;
    // Equal bounds would lock out the whole day.
    if (start->minutes_of_day() == end->minutes_of_day()) return std::nullopt;
    return quiet_window{start->minutes_of_day(), end->minutes_of_day()};
}

int local_minute_of_day(timestamp_t instant) {
    return local_time_of(instant).minutes_of_day();
}

/// Moves `candidate` to the end of the quiet window it falls in, if any.
bool move_to_quiet_hours_end(timestamp_t& candidate, const std::optional<quiet_window>& window) {
    if (!window) return false;
    int minute = local_minute_of_day(candidate);
    if (!window->contains(minute)) return false;

    time_of_day end{window->end / 60, window->end % 60};
    auto date = local_date_of(candidate);
    // In the late part of a wrapping window the end is tomorrow.
    if (window->wraps() && minute >= window->start) {
        date = date.add_days(1);
    }
    candidate = at_local_time(date, end);
    return true;
}

timestamp_t next_preferred_time(timestamp_t now, const time_of_day& preferred) {
    auto today = local_date_of(now);
    auto candidate = at_local_time(today, preferred);
    if (candidate > now) return candidate;
    return at_local_time(today.add_days(1), preferred);
}

struct adjustment {
    bool spacing = false;
    bool quiet = false;
};

adjustment apply_spacing_and_quiet(timestamp_t& candidate,
                                   const std::optional<timestamp_t>& spacing_floor,
                                   const time_of_day& preferred,
                                   const std::optional<quiet_window>& window) {
    adjustment result;
    if (spacing_floor && candidate < *spacing_floor) {
        auto floor_date = local_date_of(*spacing_floor);
        candidate = at_local_time(floor_date, preferred);
        if (candidate < *spacing_floor) {
            candidate = at_local_time(floor_date.add_days(1), preferred);
        }
        result.spacing = true;
    }
    result.quiet = move_to_quiet_hours_end(candidate, window);
    return result;
}

} // namespace

const char* to_string(reminder_gate_reason reason) noexcept {
    switch (reason) {
        case reminder_gate_reason::ok: return "ok";
        case reminder_gate_reason::disabled: return "disabled";
        case reminder_gate_reason::permission_denied: return "permission_denied";
        case reminder_gate_reason::spacing_not_elapsed: return "spacing_not_elapsed";
        case reminder_gate_reason::same_local_day: return "same_local_day";
        case reminder_gate_reason::inside_quiet_hours: return "inside_quiet_hours";
    }
    return "ok";
}

bool is_inside_quiet_hours(timestamp_t instant,
                           const std::optional<time_of_day>& start,
                           const std::optional<time_of_day>& end) {
    auto window = make_quiet_window(start, end);
    return window && window->contains(local_minute_of_day(instant));
}

reminder_gate_result evaluate_reminder_delivery_gate(const reminder_gate_input& input) noexcept {
    if (!input.reminders_enabled) {
        return {false, reminder_gate_reason::disabled};
    }
    if (!input.permission_granted) {
        return {false, reminder_gate_reason::permission_denied};
    }
    // Absolute instants only: the stored local date plays no part here.
    if (input.last_delivered_at_utc && input.now - *input.last_delivered_at_utc < input.minimum_spacing) {
        return {false, reminder_gate_reason::spacing_not_elapsed};
    }
    if (input.last_delivered_local_date && *input.last_delivered_local_date == format_local_date(input.now)) {
        return {false, reminder_gate_reason::same_local_day};
    }
    if (is_inside_quiet_hours(input.now, input.quiet_hours_start, input.quiet_hours_end)) {
        return {false, reminder_gate_reason::inside_quiet_hours};
    }
    return {true, reminder_gate_reason::ok};
}

reminder_eligibility_result compute_next_eligible_reminder(const reminder_eligibility_input& input) {
    reminder_eligibility_result result;
    auto window = make_quiet_window(input.quiet_hours_start, input.quiet_hours_end);
    const auto& preferred = input.preferred_time_local;

    auto candidate = next_preferred_time(input.now, preferred);
    result.quiet_hours_adjusted = move_to_quiet_hours_end(candidate, window);

    std::optional<timestamp_t> spacing_floor;
    if (input.last_delivered_at_utc) {
        spacing_floor = *input.last_delivered_at_utc
            + std::chrono::duration_cast<timestamp_t::duration>(input.minimum_spacing);
    }

    auto first = apply_spacing_and_quiet(candidate, spacing_floor, preferred, window);
    result.minimum_spacing_applied = first.spacing;
    result.quiet_hours_adjusted = result.quiet_hours_adjusted || first.quiet;

    for (int i = 0; i < 10 && input.last_delivered_local_date
                    && format_local_date(candidate) == *input.last_delivered_local_date; ++i) {
        result.daily_gate_applied = true;
        candidate = at_local_time(local_date_of(candidate).add_days(1), preferred);

        auto rerun = apply_spacing_and_quiet(candidate, spacing_floor, preferred, window);
        result.minimum_spacing_applied = result.minimum_spacing_applied || rerun.spacing;
        result.quiet_hours_adjusted = result.quiet_hours_adjusted || rerun.quiet;
    }

    result.candidate_local = candidate;
    result.candidate_utc = format_iso_utc(candidate);
    result.candidate_local_date = format_local_date(candidate);
    return result;
}

} // namespace pocket
