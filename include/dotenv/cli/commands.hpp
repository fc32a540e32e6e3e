#pragma once

#include <functional>
#include <iosfwd>

#include <CLI/CLI.hpp>

#include "dotenv/core/config.hpp"
#include "dotenv/export.hpp"

namespace dotenv::cli {

/// State handed to the selected subcommand once arguments and
/// configuration have been resolved.
struct CommandContext {
    Config config;
    std::ostream& out;
    std::ostream& err;
};

/// A registered subcommand and the action that runs it.
/// The action returns the process exit code.
struct Command {
    CLI::App* sub = nullptr;
    std::function<int(CommandContext&)> run;
};

/// `parse [FILE...] [--format env|json] [--raw]`
/// Prints the merged variables of all files.
DOTENV_API auto register_parse_command(CLI::App& app) -> Command;

/// `check [FILE...]`
/// Validates each file, reporting file:line: message on the first error.
DOTENV_API auto register_check_command(CLI::App& app) -> Command;

/// `get KEY [-f FILE]...`
/// Prints a single value; exit code 1 when the key is not defined.
DOTENV_API auto register_get_command(CLI::App& app) -> Command;

/// `run [-f FILE]... [--overwrite] [--prefix P] -- CMD [ARGS...]`
/// Exports the variables into the process environment and executes CMD.
DOTENV_API auto register_run_command(CLI::App& app) -> Command;

/// `version`
DOTENV_API auto register_version_command(CLI::App& app) -> Command;

} // namespace dotenv::cli
