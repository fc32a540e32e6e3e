#include "dotenv/env/environment.hpp"
#include "dotenv/core/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace dotenv::env {

namespace {

auto invalid_name(std::string_view key) -> Error {
    return make_error(ErrorCode::EnvironmentError,
                      "invalid environment variable name",
                      "'" + std::string(key) + "'");
}

} // anonymous namespace

auto is_valid_name(std::string_view key) noexcept -> bool {
    return !key.empty() &&
           key.find('=') == std::string_view::npos &&
           key.find('\0') == std::string_view::npos;
}

// ---------------------------------------------------------------------------
// ProcessEnvironment
// ---------------------------------------------------------------------------

auto ProcessEnvironment::get(std::string_view key) const -> std::optional<std::string> {
    if (!is_valid_name(key)) return std::nullopt;
    if (auto* val = std::getenv(std::string(key).c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

auto ProcessEnvironment::set(std::string_view key, std::string_view value) -> VoidResult {
    if (!is_valid_name(key)) {
        return std::unexpected(invalid_name(key));
    }
    if (::setenv(std::string(key).c_str(), std::string(value).c_str(), 1) != 0) {
        return std::unexpected(make_error(ErrorCode::EnvironmentError,
                                          "failed to set environment variable " + std::string(key),
                                          std::strerror(errno)));
    }
    return {};
}

auto ProcessEnvironment::unset(std::string_view key) -> VoidResult {
    if (!is_valid_name(key)) {
        return std::unexpected(invalid_name(key));
    }
    if (::unsetenv(std::string(key).c_str()) != 0) {
        return std::unexpected(make_error(ErrorCode::EnvironmentError,
                                          "failed to unset environment variable " + std::string(key),
                                          std::strerror(errno)));
    }
    return {};
}

// ---------------------------------------------------------------------------
// MapEnvironment
// ---------------------------------------------------------------------------

auto MapEnvironment::get(std::string_view key) const -> std::optional<std::string> {
    if (auto it = vars_.find(std::string(key)); it != vars_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto MapEnvironment::set(std::string_view key, std::string_view value) -> VoidResult {
    if (!is_valid_name(key)) {
        return std::unexpected(invalid_name(key));
    }
    vars_.insert_or_assign(std::string(key), std::string(value));
    return {};
}

auto MapEnvironment::unset(std::string_view key) -> VoidResult {
    if (!is_valid_name(key)) {
        return std::unexpected(invalid_name(key));
    }
    vars_.erase(std::string(key));
    return {};
}

// ---------------------------------------------------------------------------
// apply
// ---------------------------------------------------------------------------

auto with_prefix(const EnvMap& vars, std::string_view prefix) -> EnvMap {
    if (prefix.empty()) return vars;

    EnvMap prefixed;
    for (const auto& [key, value] : vars) {
        prefixed.emplace(std::string(prefix) + key, value);
    }
    return prefixed;
}

auto apply(const EnvMap& vars, EnvironmentAccessor& target, bool overwrite) -> VoidResult {
    size_t applied = 0;

    for (const auto& [key, value] : vars) {
        if (!overwrite && target.has(key)) {
            LOG_TRACE("Skipping existing env var: {}", key);
            continue;
        }

        if (auto result = target.set(key, value); !result) {
            LOG_WARN("Failed to set env var {}: {}", key, result.error().what());
            return result;
        }
        ++applied;
    }

    LOG_DEBUG("Applied {} of {} variables", applied, vars.size());
    return {};
}

} // namespace dotenv::env
