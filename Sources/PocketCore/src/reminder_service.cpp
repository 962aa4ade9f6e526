#include "pocket/reminder_service.hpp"
#include "pocket/log.hpp"
#include <stdexcept>

namespace pocket {

reminder_service::reminder_service(std::shared_ptr<notification_scheduler> notifier,
                                   reminder_settings settings,
                                   clock_fn clock)
    : notifier_(std::move(notifier)), settings_(std::move(settings)), clock_(std::move(clock)) {
    if (!notifier_) {
        throw std::invalid_argument("reminder_service requires a notification_scheduler");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

reminder_settings reminder_service::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void reminder_service::set_settings_observer(settings_observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

void reminder_service::mark_changed_locked() {
    changed_ = true;
}

void reminder_service::publish_changes() {
    reminder_settings snapshot;
    settings_observer observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!changed_) return;
        changed_ = false;
        if (!observer_) return;
        snapshot = settings_;
        observer = observer_;
    }
    try {
        observer(snapshot);
    } catch (const std::exception& e) {
        LOG_ERROR("reminder", "Settings observer failed: %s", e.what());
    }
}

void reminder_service::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_locked(reason);
    }
    publish_changes();
}

void reminder_service::cancel_locked(const std::string& reason) {
    try {
        size_t cancelled = notifier_->cancel_all();
        settings_.next_scheduled_at_utc.reset();
        mark_changed_locked();
        LOG_INFO("reminder", "Cancelled %zu scheduled reminder(s): %s", cancelled, reason.c_str());
    } catch (const std::exception& e) {
        LOG_ERROR("reminder", "Failed to cancel scheduled reminders (%s): %s", reason.c_str(), e.what());
    }
}

void reminder_service::schedule_next(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        schedule_next_locked(reason);
    }
    publish_changes();
}

void reminder_service::schedule_next_locked(const std::string& reason) {
    if (!settings_.reminders_enabled) {
        cancel_locked("reminders_disabled");
        return;
    }

    try {
        settings_.permission = notifier_->query_permission();
        if (settings_.permission != permission_status::granted) {
            // Permission was revoked outside the app.
            settings_.reminders_enabled = false;
            cancel_locked("permission_not_granted");
            return;
        }

        auto eligibility = compute_next_eligible_reminder(settings_.eligibility_input(clock_()));

        // Single slot: clear whatever is pending, then schedule exactly one.
        notifier_->cancel_all();
        notifier_->schedule(eligibility.candidate_local);
        settings_.next_scheduled_at_utc = eligibility.candidate_utc;
        mark_changed_locked();

        LOG_INFO("reminder", "Scheduled next reminder at %s (%s) reason=%s spacing=%d daily=%d quiet=%d",
                 eligibility.candidate_utc.c_str(),
                 eligibility.candidate_local_date.c_str(),
                 reason.c_str(),
                 eligibility.minimum_spacing_applied,
                 eligibility.daily_gate_applied,
                 eligibility.quiet_hours_adjusted);
    } catch (const std::exception& e) {
        LOG_ERROR("reminder", "Failed to schedule next reminder (%s): %s", reason.c_str(), e.what());
    }
}

bool reminder_service::on_notification_fire(timestamp_t now) {
    bool shown;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shown = fire_locked(now);
    }
    publish_changes();
    return shown;
}

bool reminder_service::fire_locked(timestamp_t now) {
    reminder_gate_result gate;
    try {
        gate = evaluate_reminder_delivery_gate(settings_.gate_input(now));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("reminder", "Cannot evaluate delivery gate: %s", e.what());
        return false;
    }

    if (!gate.allowed) {
        LOG_WARN("reminder", "Delivery blocked by gate: %s", to_string(gate.reason));
        schedule_next_locked(std::string("delivery_gate_blocked_") + to_string(gate.reason));
        return false;
    }

    settings_.last_delivered_at_utc = format_iso_utc(now);
    settings_.last_delivered_local_date = format_local_date(now);
    settings_.next_scheduled_at_utc.reset();
    mark_changed_locked();

    schedule_next_locked("delivery_success");
    return true;
}

void reminder_service::set_enabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_enabled_locked(enabled);
    }
    publish_changes();
}

void reminder_service::set_enabled_locked(bool enabled) {
    settings_.reminders_enabled = enabled;
    mark_changed_locked();

    if (!enabled) {
        cancel_locked("user_disabled");
        return;
    }

    try {
        settings_.permission = notifier_->request_permission();
    } catch (const std::exception& e) {
        LOG_ERROR("reminder", "Permission request failed: %s", e.what());
        settings_.permission = permission_status::undetermined;
    }
    if (settings_.permission != permission_status::granted) {
        settings_.reminders_enabled = false;
        cancel_locked("permission_denied_on_enable");
        return;
    }
    schedule_next_locked("user_enabled");
}

void reminder_service::runtime_gate_check(const std::string& source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runtime_gate_check_locked(source);
    }
    publish_changes();
}

void reminder_service::runtime_gate_check_locked(const std::string& source) {
    try {
        settings_.permission = notifier_->query_permission();
    } catch (const std::exception& e) {
        LOG_ERROR("reminder", "Runtime gate check failed (%s): %s", source.c_str(), e.what());
        return;
    }

    if (settings_.permission != permission_status::granted && settings_.reminders_enabled) {
        settings_.reminders_enabled = false;
        cancel_locked("permission_revoked_runtime");
        return;
    }
    if (!settings_.reminders_enabled) {
        cancel_locked("runtime_disabled");
        return;
    }
    schedule_next_locked("runtime_" + source);
}

void reminder_service::update_settings(reminder_settings settings) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(settings);
        mark_changed_locked();
        schedule_next_locked("settings_changed");
    }
    publish_changes();
}

} // namespace pocket
