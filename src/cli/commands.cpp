#include "dotenv/cli/commands.hpp"
#include "dotenv/core/logger.hpp"
#include "dotenv/env/environment.hpp"
#include "dotenv/io/loader.hpp"
#include "dotenv/io/writer.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <ostream>

#include <unistd.h>

#include <nlohmann/json.hpp>

#ifndef DOTENV_VERSION_STRING
#define DOTENV_VERSION_STRING "0.1.0-dev"
#endif

namespace dotenv::cli {

using json = nlohmann::json;

namespace {

/// Files named on the command line, or the configured ones.
auto resolve_files(const std::vector<std::string>& given, const Config& config)
    -> std::vector<std::filesystem::path>
{
    const auto& names = given.empty() ? config.files : given;
    return std::vector<std::filesystem::path>(names.begin(), names.end());
}

void report(std::ostream& err, const Error& error) {
    err << "dotenv: " << error.what() << "\n";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse command
// ---------------------------------------------------------------------------

auto register_parse_command(CLI::App& app) -> Command {
    struct Options {
        std::vector<std::string> files;
        std::string format;
        bool raw = false;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("parse", "Print the variables defined by .env files");
    sub->add_option("files", opts->files, "Files to read (default: from config)");
    sub->add_option("--format", opts->format, "Output format: env or json")
        ->check(CLI::IsMember({"env", "json"}));
    sub->add_flag("--raw", opts->raw, "Do not expand $VAR references");

    return Command{sub, [opts](CommandContext& ctx) -> int {
        parser::ParserOptions parse_opts;
        parse_opts.expand = !opts->raw;

        auto vars = io::load_files(resolve_files(opts->files, ctx.config), parse_opts);
        if (!vars) {
            report(ctx.err, vars.error());
            return 1;
        }

        auto format = opts->format.empty() ? ctx.config.format : opts->format;
        if (format == "json") {
            json j = *vars;
            ctx.out << j.dump(2) << "\n";
        } else {
            ctx.out << io::serialize(*vars);
        }
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

auto register_check_command(CLI::App& app) -> Command {
    auto files = std::make_shared<std::vector<std::string>>();

    auto* sub = app.add_subcommand("check", "Validate .env files");
    sub->add_option("files", *files, "Files to validate (default: from config)");

    return Command{sub, [files](CommandContext& ctx) -> int {
        int status = 0;
        for (const auto& path : resolve_files(*files, ctx.config)) {
            auto vars = io::load(path);
            if (!vars) {
                const auto& error = vars.error();
                if (is_parse_error(error.code())) {
                    ctx.err << path.string() << ":" << error.line() << ": "
                            << error.message() << "\n";
                } else {
                    ctx.err << path.string() << ": " << error.what() << "\n";
                }
                status = 1;
                continue;
            }
            ctx.out << path.string() << ": ok (" << vars->size() << " variables)\n";
        }
        return status;
    }};
}

// ---------------------------------------------------------------------------
// get command
// ---------------------------------------------------------------------------

auto register_get_command(CLI::App& app) -> Command {
    struct Options {
        std::string key;
        std::vector<std::string> files;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("get", "Print the value of one variable");
    sub->add_option("key", opts->key, "Variable name")->required();
    sub->add_option("-f,--file", opts->files, "File to read (repeatable)");

    return Command{sub, [opts](CommandContext& ctx) -> int {
        auto vars = io::load_files(resolve_files(opts->files, ctx.config));
        if (!vars) {
            report(ctx.err, vars.error());
            return 1;
        }

        auto it = vars->find(opts->key);
        if (it == vars->end()) {
            ctx.err << "dotenv: " << opts->key << " is not defined\n";
            return 1;
        }
        ctx.out << it->second << "\n";
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

auto register_run_command(CLI::App& app) -> Command {
    struct Options {
        std::vector<std::string> files;
        std::vector<std::string> command;
        std::string prefix;
        bool overwrite = false;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("run", "Run a command with .env variables exported");
    sub->add_option("-f,--file", opts->files, "File to read (repeatable)");
    sub->add_flag("--overwrite", opts->overwrite,
                  "Replace variables already set in the environment");
    sub->add_option("--prefix", opts->prefix, "Prefix added to every variable name");
    sub->add_option("command", opts->command, "Command and arguments")->required();

    return Command{sub, [opts](CommandContext& ctx) -> int {
        auto vars = io::load_files(resolve_files(opts->files, ctx.config));
        if (!vars) {
            report(ctx.err, vars.error());
            return 1;
        }

        auto prefix = opts->prefix.empty() ? ctx.config.prefix : opts->prefix;
        bool overwrite = opts->overwrite || ctx.config.overwrite;

        env::ProcessEnvironment process_env;
        if (auto applied = env::apply(env::with_prefix(*vars, prefix), process_env, overwrite);
            !applied) {
            report(ctx.err, applied.error());
            return 1;
        }

        std::vector<char*> argv;
        argv.reserve(opts->command.size() + 1);
        for (auto& arg : opts->command) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        LOG_DEBUG("Executing {}", opts->command.front());
        ctx.out.flush();
        ::execvp(argv[0], argv.data());

        // Only reached when exec failed.
        ctx.err << "dotenv: cannot execute " << opts->command.front() << ": "
                << std::strerror(errno) << "\n";
        return 127;
    }};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("version", "Print version information");

    return Command{sub, [](CommandContext& ctx) -> int {
        ctx.out << "dotenv " << DOTENV_VERSION_STRING << "\n";
        ctx.out << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        ctx.out << "Compiler: clang " << __clang_major__ << "."
                << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        ctx.out << "Compiler: gcc " << __GNUC__ << "."
                << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        ctx.out << "Compiler: unknown\n";
#endif
        return 0;
    }};
}

} // namespace dotenv::cli
