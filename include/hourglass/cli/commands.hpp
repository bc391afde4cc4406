#pragma once

#include <functional>

#include <CLI/CLI.hpp>

#include "hourglass/core/config.hpp"

namespace hourglass::cli {

/// State shared between the App and its subcommands. Subcommand callbacks
/// only record `action`; the App runs it once configuration is loaded.
struct CommandContext {
    Config config;
    std::function<int()> action;
};

/// Register the `daemon` subcommand.
/// Loads the job store and runs the tick loop until SIGINT/SIGTERM.
void register_daemon_command(CLI::App& app, CommandContext& ctx);

/// Register the `cron` subcommand group: list, add, remove, enable, run.
void register_cron_commands(CLI::App& app, CommandContext& ctx);

/// Register the `config` subcommand.
/// Shows or validates the current configuration.
void register_config_command(CLI::App& app, CommandContext& ctx);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app, CommandContext& ctx);

/// Register the `status` subcommand.
/// Summarises the job store.
void register_status_command(CLI::App& app, CommandContext& ctx);

} // namespace hourglass::cli
