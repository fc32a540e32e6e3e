#pragma once

#include <filesystem>
#include <istream>
#include <vector>

#include "dotenv/core/error.hpp"
#include "dotenv/core/types.hpp"
#include "dotenv/env/environment.hpp"
#include "dotenv/export.hpp"
#include "dotenv/parser/line_parser.hpp"

namespace dotenv::io {

/// Read a .env file and parse it.
/// Fails with IoError when the file cannot be read, or with the parser's
/// error for malformed content.
DOTENV_API auto load(const std::filesystem::path& path, parser::ParserOptions options = {})
    -> Result<EnvMap>;

/// Read a stream to its end and parse the contents.
DOTENV_API auto load_from_stream(std::istream& in, parser::ParserOptions options = {})
    -> Result<EnvMap>;

/// Load several files in order. Keys in later files replace keys from
/// earlier ones; each file is expanded on its own.
DOTENV_API auto load_files(const std::vector<std::filesystem::path>& paths,
                parser::ParserOptions options = {}) -> Result<EnvMap>;

/// load() followed by env::apply().
DOTENV_API auto load_and_apply(const std::filesystem::path& path,
                    env::EnvironmentAccessor& target,
                    bool overwrite = true) -> VoidResult;

} // namespace dotenv::io
