#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "dotenv/core/error.hpp"
#include "dotenv/export.hpp"

namespace dotenv::convert {

// ---------------------------------------------------------------------------
// Parsing. Each function fails with ErrorCode::ConversionFailed and the
// offending text as the error detail.
// ---------------------------------------------------------------------------

/// Base-10 signed integer with optional leading sign.
DOTENV_API auto to_int64(std::string_view s) -> Result<int64_t>;

/// Base-10 unsigned integer. Signs are rejected.
DOTENV_API auto to_uint64(std::string_view s) -> Result<uint64_t>;

/// Decimal or scientific floating-point number, plus inf/nan.
DOTENV_API auto to_double(std::string_view s) -> Result<double>;

/// Case-insensitive true/false, 1/0, yes/no, on/off, t/f.
DOTENV_API auto to_bool(std::string_view s) -> Result<bool>;

/// Signed sequence of decimal numbers, each with an optional fraction and
/// a unit suffix, e.g. "300ms", "-1.5h", "2h45m". Valid units are
/// "ns", "us" (or "µs"), "ms", "s", "m", "h". A bare "0" is allowed.
DOTENV_API auto to_duration(std::string_view s) -> Result<std::chrono::nanoseconds>;

/// Comma-separated list; elements are trimmed. Empty input yields an
/// empty list.
DOTENV_API auto to_list(std::string_view s) -> std::vector<std::string>;

template <typename T>
auto to_int(std::string_view s) -> Result<T> {
    static_assert(std::is_integral_v<T> && std::is_signed_v<T>);
    auto v = to_int64(s);
    if (!v) return std::unexpected(v.error());
    if (*v < std::numeric_limits<T>::min() || *v > std::numeric_limits<T>::max()) {
        return std::unexpected(make_error(ErrorCode::ConversionFailed,
                                          "integer out of range", std::string(s)));
    }
    return static_cast<T>(*v);
}

template <typename T>
auto to_uint(std::string_view s) -> Result<T> {
    static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>);
    auto v = to_uint64(s);
    if (!v) return std::unexpected(v.error());
    if (*v > std::numeric_limits<T>::max()) {
        return std::unexpected(make_error(ErrorCode::ConversionFailed,
                                          "unsigned integer out of range", std::string(s)));
    }
    return static_cast<T>(*v);
}

template <typename T>
auto to_float(std::string_view s) -> Result<T> {
    static_assert(std::is_floating_point_v<T>);
    auto v = to_double(s);
    if (!v) return std::unexpected(v.error());
    return static_cast<T>(*v);
}

// ---------------------------------------------------------------------------
// Formatting. Output of each formatter is accepted by the matching parser.
// ---------------------------------------------------------------------------

DOTENV_API auto format_bool(bool v) -> std::string;

/// Shortest representation that round-trips.
DOTENV_API auto format_float(double v) -> std::string;

/// "1h30m0s", "45s", "1.5s", "100ms", "2µs", "0s".
DOTENV_API auto format_duration(std::chrono::nanoseconds d) -> std::string;

} // namespace dotenv::convert
