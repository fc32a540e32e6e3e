#include "dotenv/env/typed.hpp"
#include "dotenv/core/logger.hpp"

namespace dotenv::env {

namespace detail {

void log_unconvertible(std::string_view key, const Error& error) {
    LOG_DEBUG("Ignoring {}: {}", key, error.what());
}

} // namespace detail

auto get_string(const EnvironmentAccessor& env, std::string_view key) -> std::optional<std::string> {
    return env.get(key);
}

auto get_string_or(const EnvironmentAccessor& env, std::string_view key, std::string fallback)
    -> std::string
{
    return env.get(key).value_or(std::move(fallback));
}

auto get_bool(const EnvironmentAccessor& env, std::string_view key) -> std::optional<bool> {
    return detail::lookup<bool>(env, key, convert::to_bool);
}

auto get_bool_or(const EnvironmentAccessor& env, std::string_view key, bool fallback) -> bool {
    return get_bool(env, key).value_or(fallback);
}

auto get_duration(const EnvironmentAccessor& env, std::string_view key)
    -> std::optional<std::chrono::nanoseconds>
{
    return detail::lookup<std::chrono::nanoseconds>(env, key, convert::to_duration);
}

auto get_duration_or(const EnvironmentAccessor& env, std::string_view key,
                     std::chrono::nanoseconds fallback) -> std::chrono::nanoseconds
{
    return get_duration(env, key).value_or(fallback);
}

auto get_list(const EnvironmentAccessor& env, std::string_view key)
    -> std::optional<std::vector<std::string>>
{
    auto raw = env.get(key);
    if (!raw) return std::nullopt;
    return convert::to_list(*raw);
}

} // namespace dotenv::env
