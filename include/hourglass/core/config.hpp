#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "hourglass/core/error.hpp"
#include "hourglass/core/types.hpp"

namespace hourglass {

struct CronConfig {
    bool enabled = true;
    std::string default_timezone = "UTC";  // IANA zone name
    std::optional<std::string> store_path;  // default: <data_dir>/cron/jobs.json
    int tick_interval_ms = 1000;
    int job_timeout_ms = 300000;
    int hook_timeout_ms = 200;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CronConfig, enabled, default_timezone, store_path, tick_interval_ms, job_timeout_ms, hook_timeout_ms)

struct Config {
    CronConfig cron;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, cron, log_level, data_dir)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Checks the values a running scheduler depends on: the default timezone
/// must resolve and every interval/timeout must be positive.
auto validate_config(const Config& config) -> VoidResult;

/// Location of the job store: `cron.store_path` when set, otherwise
/// `<data_dir>/cron/jobs.json`.
auto resolve_store_path(const Config& config) -> std::filesystem::path;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace hourglass
