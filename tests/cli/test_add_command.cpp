#include <catch2/catch_test_macros.hpp>

#include <CLI/CLI.hpp>

#include "hourglass/cli/app.hpp"

TEST_CASE("cron add bounds --every and --in", "[cli]") {
    hourglass::cli::App app;

    SECTION("ordinary interval parses") {
        CHECK_NOTHROW(app.cli().parse("cron add --name pulse --message hi --every 60", false));
    }

    SECTION("ordinary delay parses") {
        CHECK_NOTHROW(app.cli().parse("cron add --name once --message hi --in 3600", false));
    }

    SECTION("interval whose milliseconds overflow is rejected") {
        CHECK_THROWS_AS(
            app.cli().parse("cron add --name pulse --message hi --every 9223372036854775", false),
            CLI::ValidationError);
    }

    SECTION("delay whose milliseconds overflow is rejected") {
        CHECK_THROWS_AS(
            app.cli().parse("cron add --name once --message hi --in 9223372036854775", false),
            CLI::ValidationError);
    }

    SECTION("zero interval is rejected") {
        CHECK_THROWS_AS(
            app.cli().parse("cron add --name pulse --message hi --every 0", false),
            CLI::ValidationError);
    }
}
