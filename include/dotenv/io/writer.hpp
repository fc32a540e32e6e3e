#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "dotenv/core/error.hpp"
#include "dotenv/core/types.hpp"
#include "dotenv/export.hpp"

namespace dotenv::io {

/// True when `value` must be double-quoted to survive a parse: it contains
/// whitespace, a quote, a backslash, '#' or '$'. Empty values never need
/// quoting.
DOTENV_API auto needs_quoting(std::string_view value) -> bool;

/// Wrap `value` in double quotes, escaping backslash, double quote,
/// newline, tab and carriage return.
DOTENV_API auto quote_value(std::string_view value) -> std::string;

/// Render one value for the right-hand side of KEY=value: bare when
/// needs_quoting() is false, single-quoted when it contains '$' (so it is
/// not expanded on reload) and no single quote, otherwise quote_value().
DOTENV_API auto render_value(std::string_view value) -> std::string;

/// Render `vars` as KEY=value lines in key order, quoting where needed.
/// Non-empty output ends with a newline.
DOTENV_API auto serialize(const EnvMap& vars) -> std::string;

/// serialize() into `path`, replacing any existing file.
DOTENV_API auto write_file(const std::filesystem::path& path, const EnvMap& vars) -> VoidResult;

} // namespace dotenv::io
