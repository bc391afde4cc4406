#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "hourglass/cli/commands.hpp"
#include "hourglass/core/config.hpp"

namespace hourglass::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration
/// (file, or environment when no file is given), then runs the selected
/// subcommand (daemon, cron, status, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;

    /// Configuration resolved by the last run().
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    /// Config file when --config is given, environment otherwise;
    /// --log-level overrides either.
    void resolve_config();

    CLI::App cli_;
    CommandContext ctx_;
    std::string config_path_;
    std::string log_level_;
};

} // namespace hourglass::cli
