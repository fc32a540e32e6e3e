#include "dotenv/io/loader.hpp"
#include "dotenv/core/logger.hpp"

#include <fstream>
#include <sstream>

namespace dotenv::io {

namespace {

auto read_all(std::istream& in) -> std::string {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // anonymous namespace

auto load(const std::filesystem::path& path, parser::ParserOptions options)
    -> Result<EnvMap>
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        LOG_WARN("Not a file: {}", path.string());
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "path is a directory", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_WARN("Could not open .env file: {}", path.string());
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "failed to read file", path.string()));
    }

    auto content = read_all(file);
    if (file.bad()) {
        LOG_WARN("Error while reading .env file: {}", path.string());
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "failed to read file", path.string()));
    }

    auto env = parser::parse(content, options);
    if (!env) {
        LOG_DEBUG("{}: {}", path.string(), env.error().what());
        return env;
    }

    LOG_DEBUG("Parsed {} variables from {}", env->size(), path.string());
    return env;
}

auto load_from_stream(std::istream& in, parser::ParserOptions options) -> Result<EnvMap> {
    auto content = read_all(in);
    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError, "failed to read data"));
    }
    return parser::parse(content, options);
}

auto load_files(const std::vector<std::filesystem::path>& paths,
                parser::ParserOptions options) -> Result<EnvMap>
{
    EnvMap merged;
    for (const auto& path : paths) {
        auto env = load(path, options);
        if (!env) return std::unexpected(env.error());

        for (auto& [key, value] : *env) {
            merged.insert_or_assign(key, std::move(value));
        }
    }
    return merged;
}

auto load_and_apply(const std::filesystem::path& path,
                    env::EnvironmentAccessor& target,
                    bool overwrite) -> VoidResult
{
    auto env = load(path);
    if (!env) return std::unexpected(env.error());

    if (auto result = env::apply(*env, target, overwrite); !result) {
        return result;
    }

    LOG_INFO("Loaded .env from {}", path.string());
    return {};
}

} // namespace dotenv::io
