#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dotenv/core/convert.hpp"
#include "dotenv/env/environment.hpp"
#include "dotenv/export.hpp"

namespace dotenv::env {

// Typed reads from an EnvironmentAccessor.
//
// Every type comes as a pair: get_<type>() returns std::nullopt when the
// variable is unset or cannot be converted, get_<type>_or() substitutes
// the fallback in both cases.

namespace detail {

DOTENV_API void log_unconvertible(std::string_view key, const Error& error);

template <typename T, typename Convert>
auto lookup(const EnvironmentAccessor& env, std::string_view key, Convert convert)
    -> std::optional<T>
{
    auto raw = env.get(key);
    if (!raw) return std::nullopt;

    Result<T> value = convert(*raw);
    if (!value) {
        log_unconvertible(key, value.error());
        return std::nullopt;
    }
    return std::move(*value);
}

} // namespace detail

DOTENV_API auto get_string(const EnvironmentAccessor& env, std::string_view key) -> std::optional<std::string>;
DOTENV_API auto get_string_or(const EnvironmentAccessor& env, std::string_view key, std::string fallback)
    -> std::string;

DOTENV_API auto get_bool(const EnvironmentAccessor& env, std::string_view key) -> std::optional<bool>;
DOTENV_API auto get_bool_or(const EnvironmentAccessor& env, std::string_view key, bool fallback) -> bool;

DOTENV_API auto get_duration(const EnvironmentAccessor& env, std::string_view key)
    -> std::optional<std::chrono::nanoseconds>;
DOTENV_API auto get_duration_or(const EnvironmentAccessor& env, std::string_view key,
                     std::chrono::nanoseconds fallback) -> std::chrono::nanoseconds;

DOTENV_API auto get_list(const EnvironmentAccessor& env, std::string_view key)
    -> std::optional<std::vector<std::string>>;

template <typename T = int>
auto get_int(const EnvironmentAccessor& env, std::string_view key) -> std::optional<T> {
    return detail::lookup<T>(env, key, convert::to_int<T>);
}

template <typename T = int>
auto get_int_or(const EnvironmentAccessor& env, std::string_view key, T fallback) -> T {
    return get_int<T>(env, key).value_or(fallback);
}

template <typename T = unsigned int>
auto get_uint(const EnvironmentAccessor& env, std::string_view key) -> std::optional<T> {
    return detail::lookup<T>(env, key, convert::to_uint<T>);
}

template <typename T = unsigned int>
auto get_uint_or(const EnvironmentAccessor& env, std::string_view key, T fallback) -> T {
    return get_uint<T>(env, key).value_or(fallback);
}

template <typename T = double>
auto get_float(const EnvironmentAccessor& env, std::string_view key) -> std::optional<T> {
    return detail::lookup<T>(env, key, convert::to_float<T>);
}

template <typename T = double>
auto get_float_or(const EnvironmentAccessor& env, std::string_view key, T fallback) -> T {
    return get_float<T>(env, key).value_or(fallback);
}

} // namespace dotenv::env
