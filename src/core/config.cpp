#include "dotenv/core/config.hpp"
#include "dotenv/core/convert.hpp"
#include "dotenv/core/logger.hpp"

#include <fstream>

namespace dotenv {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        if (config.format != "env" && config.format != "json") {
            LOG_WARN("Config: unknown format '{}', using 'env'", config.format);
            config.format = "env";
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env(const env::EnvironmentAccessor& source, Config base) -> Config {
    Config config = std::move(base);

    if (auto val = source.get("DOTENV_FILES")) {
        auto files = convert::to_list(*val);
        if (!files.empty()) {
            config.files = std::move(files);
        }
    }
    if (auto val = source.get("DOTENV_OVERWRITE")) {
        if (auto flag = convert::to_bool(*val)) {
            config.overwrite = *flag;
        } else {
            LOG_WARN("Config: ignoring DOTENV_OVERWRITE: {}", flag.error().what());
        }
    }
    if (auto val = source.get("DOTENV_PREFIX")) {
        config.prefix = *val;
    }
    if (auto val = source.get("DOTENV_LOG_LEVEL")) {
        config.log_level = *val;
    }
    if (auto val = source.get("DOTENV_FORMAT")) {
        if (*val == "env" || *val == "json") {
            config.format = *val;
        } else {
            LOG_WARN("Config: ignoring DOTENV_FORMAT '{}'", *val);
        }
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

} // namespace dotenv
