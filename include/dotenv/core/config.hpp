#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dotenv/env/environment.hpp"
#include "dotenv/export.hpp"

namespace dotenv {

using json = nlohmann::json;

/// Settings for the dotenv command-line tool.
struct Config {
    std::vector<std::string> files = {".env"};
    bool overwrite = false;        // replace variables already in the environment
    std::string prefix;            // prepended to every key when applying
    std::string log_level = "info";
    std::string format = "env";    // "env" or "json"
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, files, overwrite, prefix, log_level, format)

DOTENV_API auto load_config(const std::filesystem::path& path) -> Config;

/// Start from `base` and apply DOTENV_FILES, DOTENV_OVERWRITE,
/// DOTENV_PREFIX, DOTENV_LOG_LEVEL and DOTENV_FORMAT from `source`.
DOTENV_API auto load_config_from_env(const env::EnvironmentAccessor& source, Config base = {}) -> Config;

DOTENV_API auto default_config() -> Config;

} // namespace dotenv
