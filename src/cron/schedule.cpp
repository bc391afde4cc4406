#include "hourglass/cron/schedule.hpp"
#include "hourglass/core/types.hpp"
#include "hourglass/cron/parser.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include <spdlog/fmt/fmt.h>

namespace hourglass::cron {

namespace {

/// Read exactly `width` digits at `pos`, advancing it.
auto read_digits(std::string_view text, size_t& pos, size_t width) -> std::optional<int> {
    if (pos + width > text.size()) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + width, value);
    if (ec != std::errc{} || ptr != text.data() + pos + width) return std::nullopt;
    pos += width;
    return value;
}

auto expect_char(std::string_view text, size_t& pos, std::string_view allowed) -> bool {
    if (pos >= text.size() || allowed.find(text[pos]) == std::string_view::npos) {
        return false;
    }
    ++pos;
    return true;
}

auto bad_datetime(std::string_view text) -> Error {
    return make_error(ErrorCode::InvalidSchedule,
                      "Expected local time as YYYY-MM-DDTHH:MM[:SS]",
                      std::string(text));
}

} // anonymous namespace

auto schedule_kind(const Schedule& schedule) -> std::string_view {
    return std::visit([](const auto& s) -> std::string_view {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, AtSchedule>) {
            return "at";
        } else if constexpr (std::is_same_v<T, EverySchedule>) {
            return "every";
        } else {
            static_assert(std::is_same_v<T, CronSchedule>, "unhandled schedule kind");
            return "cron";
        }
    }, schedule);
}

auto is_one_shot(const Schedule& schedule) -> bool {
    return std::holds_alternative<AtSchedule>(schedule);
}

auto locate_timezone(std::string_view tz) -> Result<const std::chrono::time_zone*> {
    if (tz.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidSchedule, "Timezone name must not be empty"));
    }
    try {
        return std::chrono::locate_zone(tz);
    } catch (const std::runtime_error&) {
        return std::unexpected(make_error(
            ErrorCode::InvalidSchedule, "Unknown timezone", std::string(tz)));
    }
}

auto validate_timezone(std::string_view tz) -> VoidResult {
    auto zone = locate_timezone(tz);
    if (!zone) return std::unexpected(zone.error());
    return {};
}

auto compute_next(const Schedule& schedule, int64_t reference_ms, std::string_view tz)
    -> Result<std::optional<int64_t>>
{
    if (const auto* at = std::get_if<AtSchedule>(&schedule)) {
        if (at->at_ms <= 0) {
            return std::unexpected(make_error(
                ErrorCode::InvalidSchedule,
                "One-shot timestamp must be positive",
                std::to_string(at->at_ms)));
        }
        if (at->at_ms > reference_ms) return at->at_ms;
        return std::optional<int64_t>{};
    }

    if (const auto* every = std::get_if<EverySchedule>(&schedule)) {
        if (every->every_ms <= 0) {
            return std::unexpected(make_error(
                ErrorCode::InvalidSchedule,
                "Interval must be positive",
                std::to_string(every->every_ms)));
        }
        if (every->every_ms > std::numeric_limits<int64_t>::max() - reference_ms) {
            return std::unexpected(make_error(
                ErrorCode::InvalidSchedule,
                "Interval overflows the next run time",
                std::to_string(every->every_ms)));
        }
        return reference_ms + every->every_ms;
    }

    const auto& cron = std::get<CronSchedule>(schedule);
    auto parsed = parse_cron(cron.expr);
    if (!parsed) return std::unexpected(parsed.error());

    auto zone = locate_timezone(tz);
    if (!zone) return std::unexpected(zone.error());

    auto next = next_occurrence(*parsed, from_epoch_ms(reference_ms), **zone);
    if (!next) return std::optional<int64_t>{};
    return to_epoch_ms(*next);
}

auto validate_schedule(const Schedule& schedule, std::string_view tz) -> VoidResult {
    if (auto zone = validate_timezone(tz); !zone) {
        return zone;
    }

    auto next = compute_next(schedule, 0, tz);
    if (!next) return std::unexpected(next.error());

    if (std::holds_alternative<CronSchedule>(schedule) && !*next) {
        return std::unexpected(make_error(
            ErrorCode::InvalidSchedule,
            "Cron expression never fires",
            std::get<CronSchedule>(schedule).expr));
    }
    return {};
}

auto parse_local_datetime(std::string_view text, std::string_view tz) -> Result<int64_t> {
    using namespace std::chrono;

    size_t pos = 0;
    auto y = read_digits(text, pos, 4);
    if (!y || !expect_char(text, pos, "-")) return std::unexpected(bad_datetime(text));
    auto mo = read_digits(text, pos, 2);
    if (!mo || !expect_char(text, pos, "-")) return std::unexpected(bad_datetime(text));
    auto d = read_digits(text, pos, 2);
    if (!d || !expect_char(text, pos, "T ")) return std::unexpected(bad_datetime(text));
    auto h = read_digits(text, pos, 2);
    if (!h || !expect_char(text, pos, ":")) return std::unexpected(bad_datetime(text));
    auto mi = read_digits(text, pos, 2);
    if (!mi) return std::unexpected(bad_datetime(text));

    int sec = 0;
    if (pos < text.size()) {
        if (!expect_char(text, pos, ":")) return std::unexpected(bad_datetime(text));
        auto s = read_digits(text, pos, 2);
        if (!s || pos != text.size()) return std::unexpected(bad_datetime(text));
        sec = *s;
    }

    year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                       day{static_cast<unsigned>(*d)}};
    if (!ymd.ok() || *h > 23 || *mi > 59 || sec > 59) {
        return std::unexpected(bad_datetime(text));
    }

    auto zone = locate_timezone(tz);
    if (!zone) return std::unexpected(zone.error());

    auto local = local_days{ymd} + hours{*h} + minutes{*mi} + seconds{sec};
    auto info = (*zone)->get_info(local);
    if (info.result == local_info::nonexistent) {
        return std::unexpected(make_error(
            ErrorCode::InvalidSchedule,
            "Local time does not exist in timezone",
            std::string(text) + " " + std::string(tz)));
    }

    auto instant = sys_seconds{local.time_since_epoch() - info.first.offset};
    return duration_cast<milliseconds>(instant.time_since_epoch()).count();
}

auto format_local(int64_t ms, std::string_view tz) -> std::string {
    using namespace std::chrono;

    const time_zone* zone = nullptr;
    if (auto found = locate_timezone(tz)) {
        zone = *found;
    } else {
        zone = locate_zone("UTC");
    }

    auto local = floor<minutes>(zone->to_local(from_epoch_ms(ms)));
    auto day = floor<days>(local);
    year_month_day ymd{day};
    hh_mm_ss hms{local - day};

    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count());
}

auto describe_schedule(const Schedule& schedule) -> std::string {
    if (const auto* at = std::get_if<AtSchedule>(&schedule)) {
        return "at " + std::to_string(at->at_ms);
    }
    if (const auto* every = std::get_if<EverySchedule>(&schedule)) {
        if (every->every_ms % 1000 == 0) {
            return "every " + std::to_string(every->every_ms / 1000) + "s";
        }
        return "every " + std::to_string(every->every_ms) + "ms";
    }
    return "cron " + std::get<CronSchedule>(schedule).expr;
}

} // namespace hourglass::cron
