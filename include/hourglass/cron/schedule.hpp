#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "hourglass/core/error.hpp"

namespace hourglass::cron {

/// Fires once at an absolute instant (ms since epoch).
struct AtSchedule {
    int64_t at_ms = 0;
    auto operator==(const AtSchedule&) const -> bool = default;
};

/// Fires every `every_ms` milliseconds, measured from creation or the last run.
struct EverySchedule {
    int64_t every_ms = 0;
    auto operator==(const EverySchedule&) const -> bool = default;
};

/// Fires at each wall-clock instant matching a cron expression.
struct CronSchedule {
    std::string expr;
    auto operator==(const CronSchedule&) const -> bool = default;
};

using Schedule = std::variant<AtSchedule, EverySchedule, CronSchedule>;

/// "at", "every" or "cron".
auto schedule_kind(const Schedule& schedule) -> std::string_view;

/// True for schedules that fire only once.
auto is_one_shot(const Schedule& schedule) -> bool;

/// Look up an IANA zone name in the time-zone database.
auto locate_timezone(std::string_view tz) -> Result<const std::chrono::time_zone*>;

auto validate_timezone(std::string_view tz) -> VoidResult;

/// Compute the first instant at which `schedule` fires strictly after
/// `reference_ms`, reading wall-clock fields in `tz`.
///
///   - at:    the timestamp itself if still ahead, std::nullopt otherwise
///   - every: reference_ms + every_ms
///   - cron:  the next matching wall-clock instant, std::nullopt if none
///            exists within kMaxSearchDays
///
/// Fails with ErrorCode::InvalidSchedule for a non-positive `at` or `every`
/// value, an interval that overflows past reference_ms, an unparsable
/// expression or an unknown timezone.
auto compute_next(const Schedule& schedule, int64_t reference_ms, std::string_view tz)
    -> Result<std::optional<int64_t>>;

/// Reject schedules that can never fire: bad input as for compute_next(),
/// plus cron expressions with no occurrence in the search horizon.
auto validate_schedule(const Schedule& schedule, std::string_view tz) -> VoidResult;

/// Parse "YYYY-MM-DDTHH:MM[:SS]" (a space may replace the 'T') as local
/// time in `tz`. Skipped local times are rejected; repeated ones resolve
/// to the earlier instant.
auto parse_local_datetime(std::string_view text, std::string_view tz) -> Result<int64_t>;

/// Render `ms` as "YYYY-MM-DD HH:MM" in `tz` (UTC if the zone is unknown).
auto format_local(int64_t ms, std::string_view tz) -> std::string;

/// Short human-readable form: "every 60s", "cron 0 9 * * *", "at <ms>".
auto describe_schedule(const Schedule& schedule) -> std::string;

} // namespace hourglass::cron
