#pragma once

#include "reminder.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pocket {

enum class permission_status {
    granted,
    denied,
    undetermined
};

const char* to_string(permission_status status) noexcept;

/// Throws std::invalid_argument for unknown names.
permission_status parse_permission_status(std::string_view text);

/// Persisted reminder preferences and delivery bookkeeping. Times are kept in
/// their serialized form ("HH:MM", ISO-8601 UTC, "YYYY-MM-DD").
struct reminder_settings {
    bool reminders_enabled = false;
    std::string preferred_time_local = "20:00";
    std::optional<std::string> quiet_hours_start;
    std::optional<std::string> quiet_hours_end;
    std::optional<std::string> last_delivered_at_utc;
    std::optional<std::string> last_delivered_local_date;
    std::optional<std::string> next_scheduled_at_utc;
    permission_status permission = permission_status::undetermined;

    /// Throws std::invalid_argument if a stored time of day is malformed.
    /// An unparseable last delivery instant is treated as absent.
    reminder_gate_input gate_input(timestamp_t now) const;
    reminder_eligibility_input eligibility_input(timestamp_t now) const;

    bool operator==(const reminder_settings&) const = default;
};

void to_json(nlohmann::json& j, const reminder_settings& s);
void from_json(const nlohmann::json& j, reminder_settings& s);

/// Missing file yields defaults. Malformed JSON throws std::invalid_argument.
reminder_settings load_reminder_settings(const std::filesystem::path& path);

/// Writes to a sibling temp file and renames it over `path`.
void save_reminder_settings(const std::filesystem::path& path, const reminder_settings& settings);

} // namespace pocket
