#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace pocket {

// Absolute instant. Local calendar views are derived from it on demand.
using timestamp_t = std::chrono::system_clock::time_point;

// Row id of an AUTOINCREMENT table.
using primary_key_t = int64_t;

// Column values as SQLite stores them. Nothing here persists blobs.
using column_value_t = std::variant<std::nullptr_t, int64_t, double, std::string>;

// ============================================================================
// Helpers for moving values in and out of column_value_t
// ============================================================================

namespace detail {
    // Booleans and integers go in as INTEGER, an empty optional as NULL.
    template<typename T>
    column_value_t to_column_value(const T& v) {
        if constexpr (std::is_same_v<T, bool>) {
            return static_cast<int64_t>(v ? 1 : 0);
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<int64_t>(v);
        } else if constexpr (std::is_floating_point_v<T>) {
            return static_cast<double>(v);
        } else {
            return std::string(v);
        }
    }

    template<typename T>
    column_value_t to_column_value(const std::optional<T>& v) {
        return v ? to_column_value(*v) : column_value_t(nullptr);
    }

    inline bool is_null(const column_value_t& v) {
        return std::holds_alternative<std::nullptr_t>(v);
    }

    // SQLite hands back REAL for integral amounts and INTEGER for whole
    // doubles depending on affinity, so both readers accept either.
    inline int64_t as_int64(const column_value_t& v) {
        if (auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
        return std::get<int64_t>(v);
    }

    inline double as_double(const column_value_t& v) {
        if (auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
        return std::get<double>(v);
    }

    inline std::string as_string(const column_value_t& v) {
        return std::get<std::string>(v);
    }

    inline std::optional<int64_t> as_optional_int64(const column_value_t& v) {
        if (is_null(v)) return std::nullopt;
        return as_int64(v);
    }

    inline std::optional<std::string> as_optional_string(const column_value_t& v) {
        if (is_null(v)) return std::nullopt;
        return as_string(v);
    }
} // namespace detail

} // namespace pocket
