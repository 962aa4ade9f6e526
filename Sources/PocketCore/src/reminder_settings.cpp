#include "pocket/reminder_settings.hpp"
#include "pocket/log.hpp"
#include <fstream>
#include <stdexcept>

namespace pocket {

namespace {

std::optional<time_of_day> parse_optional_time(const std::optional<std::string>& text) {
    if (!text || text->empty()) return std::nullopt;
    return time_of_day::parse(*text);
}

template<typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
    } else {
        out = it->template get<T>();
    }
}

template<typename T>
void write_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

} // namespace

const char* to_string(permission_status status) noexcept {
    switch (status) {
        case permission_status::granted: return "granted";
        case permission_status::denied: return "denied";
        case permission_status::undetermined: return "undetermined";
    }
    return "undetermined";
}

permission_status parse_permission_status(std::string_view text) {
    if (text == "granted") return permission_status::granted;
    if (text == "denied") return permission_status::denied;
    if (text == "undetermined") return permission_status::undetermined;
    throw std::invalid_argument("Unknown permission status \"" + std::string(text) + "\"");
}

reminder_gate_input reminder_settings::gate_input(timestamp_t now) const {
    reminder_gate_input in;
    in.now = now;
    in.reminders_enabled = reminders_enabled;
    in.permission_granted = permission == permission_status::granted;
    in.quiet_hours_start = parse_optional_time(quiet_hours_start);
    in.quiet_hours_end = parse_optional_time(quiet_hours_end);
    if (last_delivered_at_utc) {
        in.last_delivered_at_utc = parse_iso_utc(*last_delivered_at_utc);
    }
    in.last_delivered_local_date = last_delivered_local_date;
    return in;
}

reminder_eligibility_input reminder_settings::eligibility_input(timestamp_t now) const {
    reminder_eligibility_input in;
    in.now = now;
    in.preferred_time_local = time_of_day::parse(preferred_time_local);
    in.quiet_hours_start = parse_optional_time(quiet_hours_start);
    in.quiet_hours_end = parse_optional_time(quiet_hours_end);
    if (last_delivered_at_utc) {
        in.last_delivered_at_utc = parse_iso_utc(*last_delivered_at_utc);
    }
    in.last_delivered_local_date = last_delivered_local_date;
    return in;
}

void to_json(nlohmann::json& j, const reminder_settings& s) {
    j = nlohmann::json::object();
    j["reminders_enabled"] = s.reminders_enabled;
    j["preferred_time_local"] = s.preferred_time_local;
    write_optional(j, "quiet_hours_start", s.quiet_hours_start);
    write_optional(j, "quiet_hours_end", s.quiet_hours_end);
    write_optional(j, "last_delivered_at_utc", s.last_delivered_at_utc);
    write_optional(j, "last_delivered_local_date", s.last_delivered_local_date);
    write_optional(j, "next_scheduled_at_utc", s.next_scheduled_at_utc);
    j["permission"] = to_string(s.permission);
}

void from_json(const nlohmann::json& j, reminder_settings& s) {
    reminder_settings defaults;
    s.reminders_enabled = j.value("reminders_enabled", defaults.reminders_enabled);
    s.preferred_time_local = j.value("preferred_time_local", defaults.preferred_time_local);
    read_optional(j, "quiet_hours_start", s.quiet_hours_start);
    read_optional(j, "quiet_hours_end", s.quiet_hours_end);
    read_optional(j, "last_delivered_at_utc", s.last_delivered_at_utc);
    read_optional(j, "last_delivered_local_date", s.last_delivered_local_date);
    read_optional(j, "next_scheduled_at_utc", s.next_scheduled_at_utc);
    s.permission = parse_permission_status(j.value("permission", std::string("undetermined")));

    // Reject stored times that would fail later at scheduling time.
    time_of_day::parse(s.preferred_time_local);
    parse_optional_time(s.quiet_hours_start);
    parse_optional_time(s.quiet_hours_end);
}

reminder_settings load_reminder_settings(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        LOG_DEBUG("reminder", "No settings at %s, using defaults", path.string().c_str());
        return {};
    }
    try {
        return nlohmann::json::parse(in).get<reminder_settings>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("Malformed reminder settings " + path.string() + ": " + e.what());
    }
}

void save_reminder_settings(const std::filesystem::path& path, const reminder_settings& settings) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
        }
        out << nlohmann::json(settings).dump(2) << '\n';
        if (!out) {
            throw std::runtime_error("Failed writing " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path);
}

} // namespace pocket
