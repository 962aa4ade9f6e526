#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace reminder_tests {

using namespace pocket;
using namespace std::chrono_literals;
using test_support::has_local_time;
using test_support::local;

inline reminder_gate_input open_gate(timestamp_t now) {
    reminder_gate_input in;
    in.now = now;
    in.reminders_enabled = true;
    in.permission_granted = true;
    return in;
}

inline reminder_eligibility_input eligibility(timestamp_t now, const char* preferred) {
    reminder_eligibility_input in;
    in.now = now;
    in.preferred_time_local = time_of_day::parse(preferred);
    return in;
}

// ============================================================================
// Delivery gate
// ============================================================================

void test_gate_disabled() {
    std::cout << "  test_gate_disabled..." << std::flush;

    auto in = open_gate(local(2026, 2, 16, 12, 0));
    in.reminders_enabled = false;
    in.permission_granted = false;
    auto gate = evaluate_reminder_delivery_gate(in);
    assert(!gate.allowed);
    assert(gate.reason == reminder_gate_reason::disabled);

    std::cout << " OK" << std::endl;
}

void test_gate_permission_denied() {
    std::cout << "  test_gate_permission_denied..." << std::flush;

    auto in = open_gate(local(2026, 2, 16, 12, 0));
    in.permission_granted = false;
    auto gate = evaluate_reminder_delivery_gate(in);
    assert(!gate.allowed);
    assert(gate.reason == reminder_gate_reason::permission_denied);
    assert(std::string(to_string(gate.reason)) == "permission_denied");

    std::cout << " OK" << std::endl;
}

void test_gate_spacing_uses_absolute_time() {
    std::cout << "  test_gate_spacing_uses_absolute_time..." << std::flush;

    auto now = local(2026, 2, 17, 0, 0);
    auto in = open_gate(now);
    in.last_delivered_at_utc = now - 11h;
    in.last_delivered_local_date = "2000-01-01";  // deliberately unrelated

    auto gate = evaluate_reminder_delivery_gate(in);
    assert(!gate.allowed);
    assert(gate.reason == reminder_gate_reason::spacing_not_elapsed);

    std::cout << " OK" << std::endl;
}

void test_gate_time_zone_shift_cannot_bypass_spacing() {
    std::cout << "  test_gate_time_zone_shift_cannot_bypass_spacing..." << std::flush;

    auto delivered = test_support::utc(2026, 2, 16, 12, 0);
    auto in = open_gate(delivered + 12h - 1ms);
    in.last_delivered_at_utc = delivered;
    in.last_delivered_local_date = "2099-12-31";

    auto gate = evaluate_reminder_delivery_gate(in);
    assert(!gate.allowed);
    assert(gate.reason == reminder_gate_reason::spacing_not_elapsed);

    // Flying east moves the local date forward; spacing still holds.
    test_support::set_time_zone(test_support::tokyo_tz);
    gate = evaluate_reminder_delivery_gate(in);
    assert(gate.reason == reminder_gate_reason::spacing_not_elapsed);
    test_support::set_time_zone(test_support::new_york_tz);

    in.now = delivered + 12h;
    gate = evaluate_reminder_delivery_gate(in);
    assert(gate.allowed);
    assert(gate.reason == reminder_gate_reason::ok);

    std::cout << " OK" << std::endl;
}

void test_gate_same_local_day() {
    std::cout << "  test_gate_same_local_day..." << std::flush;

    auto in = open_gate(local(2026, 2, 16, 20, 0));
    in.last_delivered_at_utc = local(2026, 2, 15, 6, 0);
    in.last_delivered_local_date = "2026-02-16";

    auto gate = evaluate_reminder_delivery_gate(in);
    assert(!gate.allowed);
    assert(gate.reason == reminder_gate_reason::same_local_day);

    std::cout << " OK" << std::endl;
}

void test_gate_quiet_hours() {
    std::cout << "  test_gate_quiet_hours..." << std::flush;

    auto in = open_gate(local(2026, 2, 16, 22, 30));
    in.quiet_hours_start = time_of_day{21, 0};
    in.quiet_hours_end = time_of_day{7, 0};
    auto gate = evaluate_reminder_delivery_gate(in);
    assert(!gate.allowed);
    assert(gate.reason == reminder_gate_reason::inside_quiet_hours);

    in.now = local(2026, 2, 16, 7, 0);
    assert(evaluate_reminder_delivery_gate(in).allowed);

    std::cout << " OK" << std::endl;
}

void test_is_inside_quiet_hours() {
    std::cout << "  test_is_inside_quiet_hours..." << std::flush;

    std::optional<time_of_day> nine_pm = time_of_day{21, 0};
    std::optional<time_of_day> seven_am = time_of_day{7, 0};
    assert(is_inside_quiet_hours(local(2026, 2, 16, 23, 59), nine_pm, seven_am));
    assert(is_inside_quiet_hours(local(2026, 2, 16, 3, 0), nine_pm, seven_am));
    assert(!is_inside_quiet_hours(local(2026, 2, 16, 7, 0), nine_pm, seven_am));
    assert(!is_inside_quiet_hours(local(2026, 2, 16, 12, 0), nine_pm, seven_am));

    std::optional<time_of_day> noon = time_of_day{12, 0};
    std::optional<time_of_day> two_pm = time_of_day{14, 0};
    assert(is_inside_quiet_hours(local(2026, 2, 16, 13, 0), noon, two_pm));
    assert(!is_inside_quiet_hours(local(2026, 2, 16, 14, 0), noon, two_pm));

    // Equal bounds and missing bounds both mean "no quiet hours".
    assert(!is_inside_quiet_hours(local(2026, 2, 16, 12, 0), noon, noon));
    assert(!is_inside_quiet_hours(local(2026, 2, 16, 13, 0), noon, std::nullopt));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Next eligible slot
// ============================================================================

void test_max_one_per_local_day() {
    std::cout << "  test_max_one_per_local_day..." << std::flush;

    auto delivered = local(2026, 2, 16, 9, 0);
    auto in = eligibility(local(2026, 2, 16, 10, 0), "20:00");
    in.last_delivered_at_utc = delivered;
    in.last_delivered_local_date = format_local_date(delivered);

    auto result = compute_next_eligible_reminder(in);
    assert(result.candidate_local_date != "2026-02-16");
    assert(result.candidate_local_date == "2026-02-17");
    assert(has_local_time(result.candidate_local, 20, 0));

    std::cout << " OK" << std::endl;
}

void test_daily_cap_without_delivery_instant() {
    std::cout << "  test_daily_cap_without_delivery_instant..." << std::flush;

    auto in = eligibility(local(2026, 2, 16, 5, 0), "08:00");
    in.last_delivered_local_date = "2026-02-16";

    auto result = compute_next_eligible_reminder(in);
    assert(result.daily_gate_applied);
    assert(!result.minimum_spacing_applied);
    assert(result.candidate_local_date == "2026-02-17");
    assert(has_local_time(result.candidate_local, 8, 0));

    std::cout << " OK" << std::endl;
}

void test_preferred_time_wins_over_earlier_spacing_floor() {
    std::cout << "  test_preferred_time_wins_over_earlier_spacing_floor..." << std::flush;

    auto delivered = local(2026, 2, 15, 20, 0);
    auto in = eligibility(local(2026, 2, 16, 0, 30), "10:00");
    in.last_delivered_at_utc = delivered;
    in.last_delivered_local_date = format_local_date(delivered);

    auto result = compute_next_eligible_reminder(in);
    assert(has_local_time(result.candidate_local, 10, 0));
    assert(result.candidate_local_date == "2026-02-16");
    assert(!result.minimum_spacing_applied);

    std::cout << " OK" << std::endl;
}

void test_evening_delivery_keeps_preferred_next_morning() {
    std::cout << "  test_evening_delivery_keeps_preferred_next_morning..." << std::flush;

    auto delivered = local(2026, 2, 16, 18, 0);
    auto in = eligibility(local(2026, 2, 16, 23, 0), "08:00");
    in.last_delivered_at_utc = delivered;
    in.last_delivered_local_date = format_local_date(delivered);

    auto result = compute_next_eligible_reminder(in);
    assert(has_local_time(result.candidate_local, 8, 0));
    assert(result.candidate_local_date == "2026-02-17");

    std::cout << " OK" << std::endl;
}

void test_spacing_slips_to_next_preferred_time() {
    std::cout << "  test_spacing_slips_to_next_preferred_time..." << std::flush;

    // Floor is 12:30; 08:00 today is too early, so the next slot is 08:00
    // tomorrow rather than 12:30 today.
    auto in = eligibility(local(2026, 2, 16, 7, 0), "08:00");
    in.last_delivered_at_utc = local(2026, 2, 16, 0, 30);

    auto result = compute_next_eligible_reminder(in);
    assert(result.minimum_spacing_applied);
    assert(result.candidate_local_date == "2026-02-17");
    assert(has_local_time(result.candidate_local, 8, 0));
    assert(result.candidate_local - *in.last_delivered_at_utc >= min_reminder_spacing);

    // Custom spacing: the floor lands before 08:00 on the same day.
    in.minimum_spacing = 4h;
    result = compute_next_eligible_reminder(in);
    assert(!result.minimum_spacing_applied);
    assert(result.candidate_local_date == "2026-02-16");

    std::cout << " OK" << std::endl;
}

void test_quiet_hours_defer_to_window_end() {
    std::cout << "  test_quiet_hours_defer_to_window_end..." << std::flush;

    auto in = eligibility(local(2026, 2, 16, 4, 0), "06:30");
    in.quiet_hours_start = time_of_day{21, 0};
    in.quiet_hours_end = time_of_day{7, 0};

    auto result = compute_next_eligible_reminder(in);
    assert(has_local_time(result.candidate_local, 7, 0));
    assert(result.candidate_local_date == "2026-02-16");
    assert(result.quiet_hours_adjusted);

    std::cout << " OK" << std::endl;
}

void test_quiet_hours_late_segment_moves_to_next_day() {
    std::cout << "  test_quiet_hours_late_segment_moves_to_next_day..." << std::flush;

    auto in = eligibility(local(2026, 2, 16, 18, 0), "22:00");
    in.quiet_hours_start = time_of_day{21, 0};
    in.quiet_hours_end = time_of_day{7, 0};

    auto result = compute_next_eligible_reminder(in);
    assert(result.quiet_hours_adjusted);
    assert(result.candidate_local_date == "2026-02-17");
    assert(has_local_time(result.candidate_local, 7, 0));

    std::cout << " OK" << std::endl;
}

void test_preferred_outside_quiet_hours_unchanged() {
    std::cout << "  test_preferred_outside_quiet_hours_unchanged..." << std::flush;

    auto in = eligibility(local(2026, 2, 16, 5, 0), "08:00");
    in.quiet_hours_start = time_of_day{21, 0};
    in.quiet_hours_end = time_of_day{7, 0};

    auto result = compute_next_eligible_reminder(in);
    assert(has_local_time(result.candidate_local, 8, 0));
    assert(!result.quiet_hours_adjusted);
    assert(!result.daily_gate_applied);

    std::cout << " OK" << std::endl;
}

void test_candidate_utc_and_strictly_future() {
    std::cout << "  test_candidate_utc_and_strictly_future..." << std::flush;

    // Exactly at the preferred time: the next slot is tomorrow.
    auto in = eligibility(local(2026, 2, 16, 8, 0), "08:00");
    auto result = compute_next_eligible_reminder(in);
    assert(result.candidate_local_date == "2026-02-17");
    assert(result.candidate_utc == "2026-02-17T13:00:00.000Z");  // EST is UTC-5
    assert(parse_iso_utc(result.candidate_utc) == result.candidate_local);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Settings
// ============================================================================

void test_settings_json() {
    std::cout << "  test_settings_json..." << std::flush;

    reminder_settings s;
    s.reminders_enabled = true;
    s.preferred_time_local = "08:15";
    s.quiet_hours_start = "21:00";
    s.quiet_hours_end = "07:00";
    s.last_delivered_at_utc = "2026-02-16T13:00:00.000Z";
    s.last_delivered_local_date = "2026-02-16";
    s.permission = permission_status::granted;

    nlohmann::json j = s;
    assert(j["permission"] == "granted");
    assert(j["next_scheduled_at_utc"].is_null());
    assert(j.get<reminder_settings>() == s);

    // Missing keys take defaults.
    auto partial = nlohmann::json::parse(R"({"reminders_enabled": true})").get<reminder_settings>();
    assert(partial.reminders_enabled);
    assert(partial.preferred_time_local == "20:00");
    assert(partial.permission == permission_status::undetermined);
    assert(!partial.quiet_hours_start);

    bool threw = false;
    try {
        nlohmann::json::parse(R"({"preferred_time_local": "25:00"})").get<reminder_settings>();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto gate = s.gate_input(local(2026, 2, 16, 22, 0));
    assert(gate.permission_granted);
    assert(gate.last_delivered_at_utc == test_support::utc(2026, 2, 16, 13, 0));
    assert(gate.quiet_hours_start == (time_of_day{21, 0}));

    std::cout << " OK" << std::endl;
}

void test_settings_file() {
    std::cout << "  test_settings_file..." << std::flush;

    auto path = std::filesystem::temp_directory_path() / "pocket_test_reminders.json";
    std::filesystem::remove(path);

    auto defaults = load_reminder_settings(path);
    assert(defaults == reminder_settings{});

    reminder_settings s;
    s.reminders_enabled = true;
    s.preferred_time_local = "19:45";
    s.next_scheduled_at_utc = "2026-02-17T00:45:00.000Z";
    save_reminder_settings(path, s);
    assert(load_reminder_settings(path) == s);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    bool threw = false;
    try {
        load_reminder_settings(path);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Service
// ============================================================================

struct fake_notifier : notification_scheduler {
    permission_status permission = permission_status::granted;
    permission_status request_result = permission_status::granted;
    std::vector<timestamp_t> pending;
    size_t cancel_calls = 0;

    permission_status query_permission() override { return permission; }

    permission_status request_permission() override {
        permission = request_result;
        return permission;
    }

    void schedule(timestamp_t at) override { pending.push_back(at); }

    size_t cancel_all() override {
        ++cancel_calls;
        size_t n = pending.size();
        pending.clear();
        return n;
    }
};

void test_service_schedules_single_slot() {
    std::cout << "  test_service_schedules_single_slot..." << std::flush;

    auto notifier = std::make_shared<fake_notifier>();
    test_support::fake_clock clock;
    clock.set(local(2026, 2, 16, 5, 0));

    reminder_settings s;
    s.reminders_enabled = true;
    s.preferred_time_local = "08:00";
    reminder_service service(notifier, s, clock.fn());

    int observed = 0;
    service.set_settings_observer([&observed](const reminder_settings&) { ++observed; });

    service.schedule_next("test");
    service.schedule_next("again");
    assert(notifier->pending.size() == 1);
    assert(notifier->pending.front() == local(2026, 2, 16, 8, 0));
    assert(service.settings().next_scheduled_at_utc == "2026-02-16T13:00:00.000Z");
    assert(service.settings().permission == permission_status::granted);
    assert(observed >= 2);

    std::cout << " OK" << std::endl;
}

void test_service_disabled_cancels() {
    std::cout << "  test_service_disabled_cancels..." << std::flush;

    auto notifier = std::make_shared<fake_notifier>();
    notifier->pending.push_back(local(2026, 2, 16, 8, 0));
    reminder_service service(notifier);

    service.schedule_next();
    assert(notifier->pending.empty());
    assert(!service.settings().next_scheduled_at_utc);

    std::cout << " OK" << std::endl;
}

void test_service_permission_revoked() {
    std::cout << "  test_service_permission_revoked..." << std::flush;

    auto notifier = std::make_shared<fake_notifier>();
    reminder_settings s;
    s.reminders_enabled = true;
    reminder_service service(notifier, s);

    service.schedule_next();
    assert(notifier->pending.size() == 1);

    notifier->permission = permission_status::denied;
    service.runtime_gate_check("foreground");
    assert(notifier->pending.empty());
    assert(!service.settings().reminders_enabled);
    assert(service.settings().permission == permission_status::denied);

    std::cout << " OK" << std::endl;
}

void test_service_fire_records_delivery() {
    std::cout << "  test_service_fire_records_delivery..." << std::flush;

    auto notifier = std::make_shared<fake_notifier>();
    test_support::fake_clock clock;

    reminder_settings s;
    s.reminders_enabled = true;
    s.permission = permission_status::granted;
    s.preferred_time_local = "08:00";
    reminder_service service(notifier, s, clock.fn());

    auto fired_at = local(2026, 2, 16, 8, 0);
    clock.set(fired_at);
    assert(service.on_notification_fire(fired_at));

    auto after = service.settings();
    assert(after.last_delivered_at_utc == format_iso_utc(fired_at));
    assert(after.last_delivered_local_date == "2026-02-16");
    assert(notifier->pending.size() == 1);
    assert(notifier->pending.front() == local(2026, 2, 17, 8, 0));

    // A second fire the same evening is suppressed and rescheduled.
    auto again = local(2026, 2, 16, 21, 0);
    clock.set(again);
    assert(!service.on_notification_fire(again));
    assert(service.settings().last_delivered_at_utc == format_iso_utc(fired_at));
    assert(notifier->pending.size() == 1);
    assert(notifier->pending.front() == local(2026, 2, 17, 8, 0));

    std::cout << " OK" << std::endl;
}

void test_service_set_enabled() {
    std::cout << "  test_service_set_enabled..." << std::flush;

    auto notifier = std::make_shared<fake_notifier>();
    notifier->permission = permission_status::undetermined;
    notifier->request_result = permission_status::denied;
    reminder_service service(notifier);

    service.set_enabled(true);
    assert(!service.settings().reminders_enabled);
    assert(notifier->pending.empty());

    notifier->request_result = permission_status::granted;
    service.set_enabled(true);
    assert(service.settings().reminders_enabled);
    assert(notifier->pending.size() == 1);

    service.set_enabled(false);
    assert(!service.settings().reminders_enabled);
    assert(notifier->pending.empty());

    std::cout << " OK" << std::endl;
}

void test_service_observer_may_call_back() {
    std::cout << "  test_service_observer_may_call_back..." << std::flush;

    auto notifier = std::make_shared<fake_notifier>();
    test_support::fake_clock clock;
    clock.set(local(2026, 2, 16, 5, 0));

    reminder_settings s;
    s.reminders_enabled = true;
    s.preferred_time_local = "08:00";
    reminder_service service(notifier, s, clock.fn());

    // Reads back through the service, as a persisting observer would.
    std::vector<std::optional<std::string>> seen;
    service.set_settings_observer([&](const reminder_settings& snapshot) {
        auto current = service.settings();
        assert(current == snapshot);
        seen.push_back(current.next_scheduled_at_utc);
    });

    service.schedule_next("observer");
    assert(seen.size() == 1);
    assert(seen.back() == "2026-02-16T13:00:00.000Z");

    // A failing observer does not stop the next slot from being scheduled.
    service.set_settings_observer([](const reminder_settings&) {
        throw std::runtime_error("disk full");
    });
    auto fired_at = local(2026, 2, 16, 8, 0);
    clock.set(fired_at);
    assert(service.on_notification_fire(fired_at));
    assert(service.settings().last_delivered_local_date == "2026-02-16");
    assert(notifier->pending.size() == 1);
    assert(notifier->pending.front() == local(2026, 2, 17, 8, 0));

    std::cout << " OK" << std::endl;
}

inline void run_all() {
    std::cout << "Testing reminders..." << std::endl;
    test_support::set_time_zone(test_support::new_york_tz);
    test_gate_disabled();
    test_gate_permission_denied();
    test_gate_spacing_uses_absolute_time();
    test_gate_time_zone_shift_cannot_bypass_spacing();
    test_gate_same_local_day();
    test_gate_quiet_hours();
    test_is_inside_quiet_hours();
    test_max_one_per_local_day();
    test_daily_cap_without_delivery_instant();
    test_preferred_time_wins_over_earlier_spacing_floor();
    test_evening_delivery_keeps_preferred_next_morning();
    test_spacing_slips_to_next_preferred_time();
    test_quiet_hours_defer_to_window_end();
    test_quiet_hours_late_segment_moves_to_next_day();
    test_preferred_outside_quiet_hours_unchanged();
    test_candidate_utc_and_strictly_future();
    test_settings_json();
    test_settings_file();
    test_service_schedules_single_slot();
    test_service_disabled_cancels();
    test_service_permission_revoked();
    test_service_fire_records_delivery();
    test_service_set_enabled();
    test_service_observer_may_call_back();
}

} // namespace reminder_tests
