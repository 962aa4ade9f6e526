#include "pocket/calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace pocket {

using namespace std::chrono;

namespace {

bool parse_digits(std::string_view text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

std::optional<year_month_day> parse_ymd(std::string_view text) {
    int y, m, d;
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    if (!parse_digits(text, 0, 4, y) || !parse_digits(text, 5, 2, m) || !parse_digits(text, 8, 2, d)) {
        return std::nullopt;
    }
    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;
    return ymd;
}

local_date clamp_to_month(year_month ym, unsigned preferred_day) {
    auto last = static_cast<unsigned>(year_month_day_last{ym.year(), month_day_last{ym.month()}}.day());
    return local_date{static_cast<int>(ym.year()),
                      static_cast<unsigned>(ym.month()),
                      std::min(preferred_day, last)};
}

} // namespace

// ============================================================================
// local_date
// ============================================================================

local_date local_date::parse(std::string_view text) {
    auto ymd = parse_ymd(text);
    if (!ymd || (text.size() > 10 && text[10] != 'T' && text[10] != ' ')) {
        throw std::invalid_argument("Invalid date \"" + std::string(text) + "\". Expected YYYY-MM-DD.");
    }
    return from_ymd(*ymd);
}

local_date local_date::from_ymd(year_month_day ymd) {
    return local_date{static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day())};
}

year_month_day local_date::ymd() const {
    return year_month_day{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

std::string local_date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

local_date local_date::add_days(int days) const {
    return from_ymd(year_month_day{sys_days{ymd()} + std::chrono::days{days}});
}

local_date local_date::add_months(int months, unsigned preferred_day) const {
    auto ym = std::chrono::year{year} / std::chrono::month{month};
    ym += std::chrono::months{months};
    return clamp_to_month(ym, preferred_day ? preferred_day : day);
}

local_date local_date::add_years(int years, unsigned preferred_day) const {
    auto ym = std::chrono::year{year} / std::chrono::month{month};
    ym += std::chrono::years{years};
    return clamp_to_month(ym, preferred_day ? preferred_day : day);
}

// ============================================================================
// time_of_day
// ============================================================================

time_of_day time_of_day::parse(std::string_view text) {
    auto colon = text.find(':');
    int h = -1, m = -1;
    bool ok = colon != std::string_view::npos
        && colon >= 1 && colon <= 2
        && text.size() - colon - 1 == 2
        && parse_digits(text, 0, colon, h)
        && parse_digits(text, colon + 1, 2, m)
        && h >= 0 && h <= 23 && m >= 0 && m <= 59;
    if (!ok) {
        throw std::invalid_argument("Invalid time format \"" + std::string(text) + "\". Expected HH:MM.");
    }
    return time_of_day{h, m};
}

std::string time_of_day::to_string() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hours, minutes);
    return buf;
}

// ============================================================================
// Instant <-> local conversions
// ============================================================================

std::tm to_local_tm(timestamp_t instant) {
    std::time_t t = system_clock::to_time_t(instant);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

local_date local_date_of(timestamp_t instant) {
    auto tm = to_local_tm(instant);
    return local_date{tm.tm_year + 1900,
                      static_cast<unsigned>(tm.tm_mon + 1),
                      static_cast<unsigned>(tm.tm_mday)};
}

time_of_day local_time_of(timestamp_t instant) {
    auto tm = to_local_tm(instant);
    return time_of_day{tm.tm_hour, tm.tm_min};
}

timestamp_t at_local_time(const local_date& date, const time_of_day& time) {
    std::tm tm{};
    tm.tm_year = date.year - 1900;
    tm.tm_mon = static_cast<int>(date.month) - 1;
    tm.tm_mday = static_cast<int>(date.day);
    tm.tm_hour = time.hours;
    tm.tm_min = time.minutes;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;  // let the zone rules decide
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        throw std::invalid_argument("Local time out of range: " + date.to_string() + " " + time.to_string());
    }
    return system_clock::from_time_t(t);
}

timestamp_t start_of_local_day(const local_date& date) {
    return at_local_time(date, time_of_day{0, 0});
}

std::string format_local_date(timestamp_t instant) {
    return local_date_of(instant).to_string();
}

std::string format_iso_utc(timestamp_t instant) {
    auto ms = floor<milliseconds>(instant);
    auto dp = floor<std::chrono::days>(ms);
    year_month_day ymd{dp};
    hh_mm_ss<milliseconds> hms{ms - dp};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()),
                  static_cast<int>(hms.subseconds().count()));
    return buf;
}

std::optional<timestamp_t> parse_iso_utc(std::string_view text) {
    auto ymd = parse_ymd(text);
    if (!ymd || text.size() < 16 || (text[10] != 'T' && text[10] != ' ') || text[13] != ':') {
        return std::nullopt;
    }

    int h, m, s = 0, frac_ms = 0;
    if (!parse_digits(text, 11, 2, h) || !parse_digits(text, 14, 2, m)) return std::nullopt;

    size_t pos = 16;
    if (pos < text.size() && text[pos] == ':') {
        if (!parse_digits(text, pos + 1, 2, s)) return std::nullopt;
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int scale = 100;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                frac_ms += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }
    }
    if (h > 23 || m > 59 || s > 60) return std::nullopt;

    int offset_minutes = 0;
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int oh, om;
        if (!parse_digits(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':'
            || !parse_digits(text, pos + 4, 2, om)) {
            return std::nullopt;
        }
        offset_minutes = (oh * 60 + om) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    auto instant = sys_days{*ymd} + hours{h} + minutes{m} + seconds{s} + milliseconds{frac_ms}
                 - minutes{offset_minutes};
    return time_point_cast<system_clock::duration>(instant);
}

} // namespace pocket
