#pragma once

#include "reminder_settings.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace pocket {

/// Host-side bridge to the OS notification facility.
struct notification_scheduler {
    virtual ~notification_scheduler() = default;

    /// Current permission without prompting the user.
    virtual permission_status query_permission() = 0;

    /// Prompt the user if the platform allows it.
    virtual permission_status request_permission() = 0;

    /// Schedule one reminder notification at `at`.
    virtual void schedule(timestamp_t at) = 0;

    /// Cancel every pending reminder. Returns how many were cancelled.
    virtual size_t cancel_all() = 0;
};

// ============================================================================
// reminder_service - keeps exactly one reminder scheduled
// ============================================================================
//
// Owns the reminder_settings snapshot and drives the notification_scheduler
// from it. The eligibility computation is re-run at fire time because the
// device clock or time zone may have changed since the slot was chosen.
// Notifier failures are logged and never propagate to the caller.

class reminder_service {
public:
    using clock_fn = std::function<timestamp_t()>;
    using settings_observer = std::function<void(const reminder_settings&)>;

    explicit reminder_service(std::shared_ptr<notification_scheduler> notifier,
                              reminder_settings settings = {},
                              clock_fn clock = {});

    reminder_service(const reminder_service&) = delete;
    reminder_service& operator=(const reminder_service&) = delete;

    /// Replace the pending reminder with the next eligible slot. Cancels
    /// instead when reminders are off, and turns reminders off when
    /// permission is no longer granted.
    void schedule_next(const std::string& reason = "reschedule");

    /// Called when a scheduled reminder fires. Returns whether it should be
    /// shown. Either way the next slot is scheduled.
    bool on_notification_fire(timestamp_t now);

    /// User toggle. Enabling requests permission first.
    void set_enabled(bool enabled);

    void cancel(const std::string& reason = "cancelled");

    /// Re-check permission and state, e.g. when the app returns to the
    /// foreground.
    void runtime_gate_check(const std::string& source = "runtime");

    /// Replace preferences (preferred time, quiet hours) and reschedule.
    void update_settings(reminder_settings settings);

    reminder_settings settings() const;

    /// Invoked with the new snapshot after a call that changed it, e.g. to
    /// persist it. Runs with no lock held, so it may call back into the
    /// service. Exceptions it throws are logged and dropped.
    void set_settings_observer(settings_observer observer);

private:
    void schedule_next_locked(const std::string& reason);
    void cancel_locked(const std::string& reason);
    bool fire_locked(timestamp_t now);
    void set_enabled_locked(bool enabled);
    void runtime_gate_check_locked(const std::string& source);
    void mark_changed_locked();
    void publish_changes();

    std::shared_ptr<notification_scheduler> notifier_;
    reminder_settings settings_;
    clock_fn clock_;
    settings_observer observer_;
    bool changed_ = false;
    mutable std::mutex mutex_;
};

} // namespace pocket
