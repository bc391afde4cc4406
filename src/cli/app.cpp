#include "hourglass/cli/app.hpp"
#include "hourglass/core/logger.hpp"

#include <filesystem>

// Set from the project version by the build.
#ifndef HOURGLASS_VERSION_STRING
#define HOURGLASS_VERSION_STRING "0.1.0-dev"
#endif

namespace hourglass::cli {

App::App()
    : cli_("hourglass", "Persistent recurring task scheduler")
{
    cli_.set_version_flag("--version", HOURGLASS_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("HOURGLASS_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("HOURGLASS_LOG_LEVEL");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    resolve_config();
    Logger::init("hourglass", ctx_.config.log_level);
    LOG_DEBUG("Configuration source: {}",
              config_path_.empty() ? std::string("environment") : config_path_);

    if (!ctx_.action) {
        return 0;
    }
    auto code = ctx_.action();
    Logger::flush();
    return code;
}

void App::resolve_config() {
    ctx_.config = config_path_.empty()
        ? load_config_from_env()
        : load_config(std::filesystem::path(config_path_));
    if (!log_level_.empty()) {
        ctx_.config.log_level = log_level_;
    }
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return ctx_.config;
}

auto App::config() const -> const Config& {
    return ctx_.config;
}

void App::setup_commands() {
    register_daemon_command(cli_, ctx_);
    register_cron_commands(cli_, ctx_);
    register_config_command(cli_, ctx_);
    register_version_command(cli_, ctx_);
    register_status_command(cli_, ctx_);
}

} // namespace hourglass::cli
