#include "dotenv/cli/app.hpp"
#include "dotenv/core/logger.hpp"
#include "dotenv/env/environment.hpp"

#include <filesystem>

// Version string; typically injected by CMake via -DDOTENV_VERSION_STRING=...
#ifndef DOTENV_VERSION_STRING
#define DOTENV_VERSION_STRING "0.1.0-dev"
#endif

namespace dotenv::cli {

App::App(std::ostream& out, std::ostream& err)
    : cli_("dotenv", "Parse, check and apply .env files")
    , out_(out)
    , err_(err)
{
    cli_.set_version_flag("--version", DOTENV_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("DOTENV_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, const char* const* argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e, out_, err_);
    }

    resolve_config();
    Logger::init("dotenv", config_.log_level);

    for (auto& command : commands_) {
        if (command.sub->parsed()) {
            CommandContext ctx{config_, out_, err_};
            return command.run(ctx);
        }
    }

    // require_subcommand(1) makes this unreachable from the command line.
    err_ << "dotenv: no command given\n";
    return 1;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    commands_.push_back(register_parse_command(cli_));
    commands_.push_back(register_check_command(cli_));
    commands_.push_back(register_get_command(cli_));
    commands_.push_back(register_run_command(cli_));
    commands_.push_back(register_version_command(cli_));
}

void App::resolve_config() {
    config_ = config_path_.empty()
        ? default_config()
        : load_config(std::filesystem::path(config_path_));

    env::ProcessEnvironment process_env;
    config_ = load_config_from_env(process_env, std::move(config_));

    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
}

} // namespace dotenv::cli
