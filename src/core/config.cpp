#include "hourglass/core/config.hpp"
#include "hourglass/core/logger.hpp"
#include "hourglass/cron/schedule.hpp"

#include <cstdlib>
#include <fstream>

namespace hourglass {

namespace {

/// Expands `${VAR}` references in the path-like settings.
void resolve_paths(Config& config) {
    if (config.data_dir) {
        config.data_dir = resolve_env_refs(*config.data_dir);
    }
    if (config.cron.store_path) {
        config.cron.store_path = resolve_env_refs(*config.cron.store_path);
    }
}

} // anonymous namespace

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

        // Older configs kept the zone under cron.timezone.
        if (j.contains("cron") && j["cron"].is_object()) {
            auto& cron = j["cron"];
            if (!cron.contains("default_timezone") && cron.contains("timezone") &&
                cron["timezone"].is_string()) {
                cron["default_timezone"] = cron["timezone"];
                LOG_DEBUG("Config: migrated cron.timezone to cron.default_timezone");
            }
        }

        auto config = j.get<Config>();
        resolve_paths(config);
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("HOURGLASS_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("HOURGLASS_DATA_DIR")) {
        config.data_dir = val;
    }
    if (auto* val = std::getenv("HOURGLASS_TIMEZONE")) {
        config.cron.default_timezone = val;
    }
    if (auto* val = std::getenv("HOURGLASS_STORE_PATH")) {
        config.cron.store_path = val;
    }
    if (auto* val = std::getenv("HOURGLASS_TICK_MS")) {
        try {
            config.cron.tick_interval_ms = std::stoi(val);
        } catch (const std::exception& e) {
            LOG_WARN("Ignoring HOURGLASS_TICK_MS='{}': {}", val, e.what());
        }
    }

    resolve_paths(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("HOURGLASS_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".hourglass";
}

auto validate_config(const Config& config) -> VoidResult {
    if (auto tz = cron::validate_timezone(config.cron.default_timezone); !tz) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "cron.default_timezone is not a known timezone",
            config.cron.default_timezone));
    }
    if (config.cron.tick_interval_ms <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "cron.tick_interval_ms must be positive",
            std::to_string(config.cron.tick_interval_ms)));
    }
    if (config.cron.job_timeout_ms <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "cron.job_timeout_ms must be positive",
            std::to_string(config.cron.job_timeout_ms)));
    }
    if (config.cron.hook_timeout_ms <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "cron.hook_timeout_ms must be positive",
            std::to_string(config.cron.hook_timeout_ms)));
    }
    return {};
}

auto resolve_store_path(const Config& config) -> std::filesystem::path {
    if (config.cron.store_path && !config.cron.store_path->empty()) {
        return *config.cron.store_path;
    }
    auto data_dir = config.data_dir
        ? std::filesystem::path(*config.data_dir)
        : default_data_dir();
    return data_dir / "cron" / "jobs.json";
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Escaped: $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace hourglass
