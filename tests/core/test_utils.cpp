#include <catch2/catch_test_macros.hpp>

#include "hourglass/core/utils.hpp"

TEST_CASE("generate_uuid produces valid format", "[utils]") {
    auto uuid = hourglass::utils::generate_uuid();
    // UUID v4 format: 8-4-4-4-12 = 36 chars
    REQUIRE(uuid.size() == 36);
    CHECK(uuid[8] == '-');
    CHECK(uuid[13] == '-');
    CHECK(uuid[18] == '-');
    CHECK(uuid[23] == '-');
    CHECK(uuid != hourglass::utils::generate_uuid());
}

TEST_CASE("timestamp_ms is wall-clock milliseconds", "[utils]") {
    auto ms = hourglass::utils::timestamp_ms();
    CHECK(ms > 1'700'000'000'000);  // after November 2023
}

TEST_CASE("trim removes whitespace", "[utils]") {
    CHECK(hourglass::utils::trim("  hello  ") == "hello");
    CHECK(hourglass::utils::trim("\t\nhello\r\n") == "hello");
    CHECK(hourglass::utils::trim("hello") == "hello");
    CHECK(hourglass::utils::trim("   ").empty());
}

TEST_CASE("split keeps empty parts", "[utils]") {
    using hourglass::utils::split;

    SECTION("plain list") {
        auto parts = split("1,2,3", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "1");
        CHECK(parts[2] == "3");
    }

    SECTION("trailing delimiter") {
        auto parts = split("a,", ',');
        REQUIRE(parts.size() == 2);
        CHECK(parts[1].empty());
    }

    SECTION("empty input") {
        auto parts = split("", ',');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0].empty());
    }
}

TEST_CASE("to_lower and icontains", "[utils]") {
    CHECK(hourglass::utils::to_lower("MON-Fri") == "mon-fri");
    CHECK(hourglass::utils::icontains("Daily Report", "report"));
    CHECK(hourglass::utils::icontains("Daily Report", ""));
    CHECK_FALSE(hourglass::utils::icontains("Daily Report", "weekly"));
}
