#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "hourglass/core/config.hpp"

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = hourglass::default_config();

    SECTION("cron defaults") {
        CHECK(cfg.cron.enabled == true);
        CHECK(cfg.cron.default_timezone == "UTC");
        CHECK_FALSE(cfg.cron.store_path.has_value());
        CHECK(cfg.cron.tick_interval_ms == 1000);
        CHECK(cfg.cron.job_timeout_ms == 300000);
        CHECK(cfg.cron.hook_timeout_ms == 200);
    }

    SECTION("log level defaults") {
        CHECK(cfg.log_level == "info");
        CHECK_FALSE(cfg.data_dir.has_value());
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "hourglass_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "log_level": "debug",
            "data_dir": "/var/lib/hourglass",
            "cron": {
                "default_timezone": "Europe/Berlin",
                "tick_interval_ms": 250,
                "job_timeout_ms": 5000
            }
        })";
    }

    auto cfg = hourglass::load_config(tmp);

    CHECK(cfg.log_level == "debug");
    REQUIRE(cfg.data_dir.has_value());
    CHECK(*cfg.data_dir == "/var/lib/hourglass");
    CHECK(cfg.cron.default_timezone == "Europe/Berlin");
    CHECK(cfg.cron.tick_interval_ms == 250);
    CHECK(cfg.cron.job_timeout_ms == 5000);
    // Fields not present keep their defaults
    CHECK(cfg.cron.hook_timeout_ms == 200);
    CHECK(cfg.cron.enabled == true);

    fs::remove(tmp);
}

TEST_CASE("load_config migrates cron.timezone", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "hourglass_test_config_legacy.json";
    {
        std::ofstream out(tmp);
        out << R"({"cron": {"timezone": "Asia/Shanghai"}})";
    }

    auto cfg = hourglass::load_config(tmp);
    CHECK(cfg.cron.default_timezone == "Asia/Shanghai");

    fs::remove(tmp);
}

TEST_CASE("load_config falls back to defaults", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = hourglass::load_config("/nonexistent/path/hourglass.json");
        CHECK(cfg.cron.default_timezone == "UTC");
        CHECK(cfg.log_level == "info");
    }

    SECTION("malformed JSON") {
        auto tmp = fs::temp_directory_path() / "hourglass_test_config_bad.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = hourglass::load_config(tmp);
        CHECK(cfg.cron.tick_interval_ms == 1000);
        fs::remove(tmp);
    }
}

TEST_CASE("load_config_from_env reads HOURGLASS_ variables", "[config]") {
    setenv("HOURGLASS_TIMEZONE", "America/New_York", 1);
    setenv("HOURGLASS_STORE_PATH", "/tmp/hourglass-env/jobs.json", 1);
    setenv("HOURGLASS_TICK_MS", "500", 1);

    auto cfg = hourglass::load_config_from_env();
    CHECK(cfg.cron.default_timezone == "America/New_York");
    REQUIRE(cfg.cron.store_path.has_value());
    CHECK(*cfg.cron.store_path == "/tmp/hourglass-env/jobs.json");
    CHECK(cfg.cron.tick_interval_ms == 500);

    SECTION("unparsable tick interval is ignored") {
        setenv("HOURGLASS_TICK_MS", "fast", 1);
        auto fallback = hourglass::load_config_from_env();
        CHECK(fallback.cron.tick_interval_ms == 1000);
    }

    unsetenv("HOURGLASS_TIMEZONE");
    unsetenv("HOURGLASS_STORE_PATH");
    unsetenv("HOURGLASS_TICK_MS");
}

TEST_CASE("validate_config", "[config]") {
    auto cfg = hourglass::default_config();

    SECTION("defaults are valid") {
        CHECK(hourglass::validate_config(cfg).has_value());
    }

    SECTION("unknown timezone") {
        cfg.cron.default_timezone = "Mars/Olympus_Mons";
        auto result = hourglass::validate_config(cfg);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == hourglass::ErrorCode::InvalidConfig);
    }

    SECTION("non-positive intervals") {
        cfg.cron.tick_interval_ms = 0;
        CHECK_FALSE(hourglass::validate_config(cfg).has_value());
        cfg.cron.tick_interval_ms = 1000;
        cfg.cron.job_timeout_ms = -1;
        CHECK_FALSE(hourglass::validate_config(cfg).has_value());
        cfg.cron.job_timeout_ms = 1000;
        cfg.cron.hook_timeout_ms = 0;
        CHECK_FALSE(hourglass::validate_config(cfg).has_value());
    }
}

TEST_CASE("resolve_store_path", "[config]") {
    auto cfg = hourglass::default_config();

    SECTION("explicit store path wins") {
        cfg.cron.store_path = "/srv/jobs.json";
        cfg.data_dir = "/var/lib/hourglass";
        CHECK(hourglass::resolve_store_path(cfg) == std::filesystem::path("/srv/jobs.json"));
    }

    SECTION("derived from data dir") {
        cfg.data_dir = "/var/lib/hourglass";
        CHECK(hourglass::resolve_store_path(cfg) ==
              std::filesystem::path("/var/lib/hourglass/cron/jobs.json"));
    }
}
