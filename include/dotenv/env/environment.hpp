#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "dotenv/core/error.hpp"
#include "dotenv/core/types.hpp"
#include "dotenv/export.hpp"

namespace dotenv::env {

/// Narrow view of a variable store. Parsing and binding go through this
/// interface so they can be exercised without touching the real process
/// environment.
class DOTENV_API EnvironmentAccessor {
public:
    virtual ~EnvironmentAccessor() = default;

    [[nodiscard]] virtual auto get(std::string_view key) const -> std::optional<std::string> = 0;
    virtual auto set(std::string_view key, std::string_view value) -> VoidResult = 0;
    virtual auto unset(std::string_view key) -> VoidResult = 0;

    [[nodiscard]] auto has(std::string_view key) const -> bool { return get(key).has_value(); }
};

/// The real process environment (getenv/setenv/unsetenv).
class DOTENV_API ProcessEnvironment : public EnvironmentAccessor {
public:
    [[nodiscard]] auto get(std::string_view key) const -> std::optional<std::string> override;
    auto set(std::string_view key, std::string_view value) -> VoidResult override;
    auto unset(std::string_view key) -> VoidResult override;
};

/// In-memory store with the same name rules as the process environment.
class DOTENV_API MapEnvironment : public EnvironmentAccessor {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(EnvMap vars) : vars_(std::move(vars)) {}

    [[nodiscard]] auto get(std::string_view key) const -> std::optional<std::string> override;
    auto set(std::string_view key, std::string_view value) -> VoidResult override;
    auto unset(std::string_view key) -> VoidResult override;

    [[nodiscard]] auto snapshot() const noexcept -> const EnvMap& { return vars_; }

private:
    EnvMap vars_;
};

/// Whether `key` can be stored in an environment: non-empty, no '=' and
/// no NUL byte.
DOTENV_API auto is_valid_name(std::string_view key) noexcept -> bool;

/// Copy of `vars` with `prefix` prepended to every key.
DOTENV_API auto with_prefix(const EnvMap& vars, std::string_view prefix) -> EnvMap;

/// Copy every entry of `vars` into `target`, in key order.
///
/// Existing variables are kept when `overwrite` is false. Stops at the
/// first failure; entries already set stay set.
DOTENV_API auto apply(const EnvMap& vars, EnvironmentAccessor& target, bool overwrite = true)
    -> VoidResult;

} // namespace dotenv::env
