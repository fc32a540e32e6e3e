#pragma once

#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "dotenv/cli/commands.hpp"
#include "dotenv/core/config.hpp"
#include "dotenv/export.hpp"

namespace dotenv::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, resolves the configuration
/// (config file, then DOTENV_* environment overrides, then command-line
/// flags) and dispatches to the selected subcommand.
class DOTENV_API App {
public:
    explicit App(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, const char* const* argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// Configuration in effect for the last run().
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();
    void resolve_config();

    CLI::App cli_;
    std::ostream& out_;
    std::ostream& err_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    std::vector<Command> commands_;
};

} // namespace dotenv::cli
