#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <vector>

#include "hourglass/core/types.hpp"
#include "hourglass/cron/parser.hpp"

using namespace hourglass;
using namespace hourglass::cron;

namespace {

auto zone(const char* name) -> const std::chrono::time_zone& {
    return *std::chrono::locate_zone(name);
}

auto next_ms(const CronExpression& expr, int64_t from, const char* tz = "UTC")
    -> std::optional<int64_t>
{
    auto next = next_occurrence(expr, from_epoch_ms(from), zone(tz));
    if (!next) return std::nullopt;
    return to_epoch_ms(*next);
}

auto parse_ok(const char* text) -> CronExpression {
    auto parsed = parse_cron(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

constexpr int64_t kJan1_2024 = 1704067200000;  // Mon 2024-01-01 00:00:00Z

} // namespace

TEST_CASE("parse_cron field syntax", "[cron][parser]") {
    SECTION("wildcards expand to the full range") {
        auto expr = parse_ok("* * * * *");
        CHECK(expr.minutes.size() == 60);
        CHECK(expr.hours.size() == 24);
        CHECK(expr.days.size() == 31);
        CHECK(expr.months.size() == 12);
        CHECK(expr.weekdays.size() == 7);
        CHECK_FALSE(expr.days_restricted);
        CHECK_FALSE(expr.weekdays_restricted);
        CHECK_FALSE(expr.has_seconds);
    }

    SECTION("steps, ranges and lists") {
        auto expr = parse_ok("*/15 9-17/4 1,15 * 1-5");
        CHECK(expr.minutes == std::vector<int>{0, 15, 30, 45});
        CHECK(expr.hours == std::vector<int>{9, 13, 17});
        CHECK(expr.days == std::vector<int>{1, 15});
        CHECK(expr.weekdays == std::vector<int>{1, 2, 3, 4, 5});
        CHECK(expr.days_restricted);
        CHECK(expr.weekdays_restricted);
    }

    SECTION("N/S runs to the end of the range") {
        auto expr = parse_ok("50/5 * * * *");
        CHECK(expr.minutes == std::vector<int>{50, 55});
    }

    SECTION("step wider than the field keeps only the start") {
        auto expr = parse_ok("59/2147483647 */2147483647 * * *");
        CHECK(expr.minutes == std::vector<int>{59});
        CHECK(expr.hours == std::vector<int>{0});

        auto next = next_ms(expr, kJan1_2024);
        REQUIRE(next.has_value());
        CHECK(*next == kJan1_2024 + 59 * 60000);
    }

    SECTION("lists are sorted and deduplicated") {
        auto expr = parse_ok("30,5,30,10 * * * *");
        CHECK(expr.minutes == std::vector<int>{5, 10, 30});
    }

    SECTION("month and day names are case-insensitive") {
        auto expr = parse_ok("0 0 * JAN-mar Mon,FRI");
        CHECK(expr.months == std::vector<int>{1, 2, 3});
        CHECK(expr.weekdays == std::vector<int>{1, 5});
    }

    SECTION("weekday 7 is Sunday") {
        auto expr = parse_ok("0 0 * * 0,7");
        CHECK(expr.weekdays == std::vector<int>{0});
    }

    SECTION("six fields carry seconds") {
        auto expr = parse_ok("*/20 * * * * *");
        CHECK(expr.has_seconds);
        CHECK(expr.seconds == std::vector<int>{0, 20, 40});
    }

    SECTION("extra whitespace between fields") {
        auto expr = parse_ok("  0\t9  * * *  ");
        CHECK(expr.minutes == std::vector<int>{0});
        CHECK(expr.hours == std::vector<int>{9});
    }
}

TEST_CASE("parse_cron rejects malformed expressions", "[cron][parser]") {
    const char* bad[] = {
        "",
        "* * * *",
        "* * * * * * *",
        "60 * * * *",
        "* 24 * * *",
        "* * 0 * *",
        "* * * 13 *",
        "* * * * 8",
        "*/0 * * * *",
        "5-1 * * * *",
        "1,,2 * * * *",
        "a * * * *",
        "1- * * * *",
        "* * * foo *",
    };
    for (const char* text : bad) {
        INFO(text);
        auto parsed = parse_cron(text);
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code() == ErrorCode::InvalidSchedule);
    }
}

TEST_CASE("next_occurrence basic search", "[cron][parser]") {
    SECTION("next quarter hour") {
        auto expr = parse_ok("*/15 * * * *");
        CHECK(next_ms(expr, 1704067650000) == 1704068100000);  // 00:07:30 -> 00:15
    }

    SECTION("strictly after the reference") {
        auto expr = parse_ok("0 9 * * *");
        CHECK(next_ms(expr, 1704099600000) == 1704099600000 + 86400000);
    }

    SECTION("sub-minute reference rounds forward") {
        auto expr = parse_ok("* * * * *");
        CHECK(next_ms(expr, kJan1_2024 + 1) == kJan1_2024 + 60000);
    }

    SECTION("weekday range skips the weekend") {
        auto expr = parse_ok("0 9 * * 1-5");
        CHECK(next_ms(expr, 1704499200000) == 1704704400000);  // Sat -> Mon 09:00
    }

    SECTION("day-of-month and day-of-week are OR-ed when both restricted") {
        auto expr = parse_ok("0 0 13 * 5");
        CHECK(next_ms(expr, 1725148800000) == 1725580800000);  // Fri 2024-09-06
    }

    SECTION("only day-of-month restricted") {
        auto expr = parse_ok("0 0 13 * *");
        CHECK(next_ms(expr, 1725148800000) == 1726185600000);  // 2024-09-13
    }

    SECTION("leap day is found years ahead") {
        auto expr = parse_ok("0 0 29 2 *");
        CHECK(next_ms(expr, 1735689600000) == 1835395200000);  // 2028-02-29
    }

    SECTION("impossible date never fires") {
        auto expr = parse_ok("0 0 31 2 *");
        CHECK_FALSE(next_ms(expr, kJan1_2024).has_value());
    }

    SECTION("seconds field") {
        auto expr = parse_ok("*/10 * * * * *");
        CHECK(next_ms(expr, 1704067205000) == 1704067210000);
    }
}

TEST_CASE("next_occurrence respects the timezone", "[cron][parser]") {
    auto expr = parse_ok("0 9 * * *");
    // 2024-01-01 08:00 in Shanghai -> 09:00 the same day
    CHECK(next_ms(expr, kJan1_2024, "Asia/Shanghai") == 1704070800000);
}

TEST_CASE("next_occurrence across daylight-saving transitions", "[cron][parser][dst]") {
    const char* ny = "America/New_York";

    SECTION("9am after spring-forward") {
        auto expr = parse_ok("0 9 * * *");
        // 2024-03-09 12:00 EST -> 2024-03-10 09:00 EDT
        CHECK(next_ms(expr, 1710003600000, ny) == 1710075600000);
    }

    SECTION("skipped local time is never selected") {
        auto expr = parse_ok("30 2 * * *");
        // 02:30 does not exist on 2024-03-10; next is 2024-03-11 02:30 EDT
        CHECK(next_ms(expr, 1710046800000, ny) == 1710138600000);
    }

    SECTION("repeated local time fires once") {
        auto expr = parse_ok("30 1 * * *");
        auto first = next_ms(expr, 1730606400000, ny);  // 2024-11-03 00:00 EDT
        REQUIRE(first.has_value());
        CHECK(*first == 1730611800000);  // 01:30 EDT, the earlier instant
        CHECK(next_ms(expr, *first, ny) == 1730701800000);  // 2024-11-04 01:30 EST
    }

    SECTION("created inside the repeated hour") {
        auto expr = parse_ok("30 1 * * *");
        // 01:10 EST (second pass) -> 01:30 EST
        CHECK(next_ms(expr, 1730614200000, ny) == 1730615400000);
    }

    SECTION("9am after fall-back") {
        auto expr = parse_ok("0 9 * * *");
        CHECK(next_ms(expr, 1730552400000, ny) == 1730642400000);
    }
}

TEST_CASE("matches", "[cron][parser]") {
    const auto& utc = zone("UTC");

    SECTION("five-field expression ignores seconds") {
        auto expr = parse_ok("0 9 * * *");
        CHECK(matches(expr, from_epoch_ms(1704099600000), utc));
        CHECK(matches(expr, from_epoch_ms(1704099600000 + 30000), utc));
        CHECK_FALSE(matches(expr, from_epoch_ms(1704099600000 + 60000), utc));
    }

    SECTION("six-field expression checks seconds") {
        auto expr = parse_ok("30 0 9 * * *");
        CHECK(matches(expr, from_epoch_ms(1704099600000 + 30000), utc));
        CHECK_FALSE(matches(expr, from_epoch_ms(1704099600000), utc));
    }

    SECTION("wall-clock fields are read in the zone") {
        auto expr = parse_ok("0 9 * * *");
        CHECK(matches(expr, from_epoch_ms(1704070800000), zone("Asia/Shanghai")));
        CHECK_FALSE(matches(expr, from_epoch_ms(1704070800000), utc));
    }
}
