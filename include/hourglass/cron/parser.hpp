#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

#include "hourglass/core/error.hpp"
#include "hourglass/core/types.hpp"

namespace hourglass::cron {

/// Parsed representation of a standard cron expression.
///
/// Each field is a sorted, deduplicated vector of the matching values.
/// Supports: single values, ranges (1-5), steps (*/5, 1-10/2),
/// lists (1,3,5), wildcards (*), and named days/months.
struct CronExpression {
    std::vector<int> seconds = {0};  // 0-59, only restricted in 6-field form
    std::vector<int> minutes;        // 0-59
    std::vector<int> hours;          // 0-23
    std::vector<int> days;           // 1-31  (day of month)
    std::vector<int> months;         // 1-12
    std::vector<int> weekdays;       // 0-6   (0 = Sunday)

    // A field is "restricted" when it does not start with '*'. When both
    // day fields are restricted a day matches if either of them matches.
    bool days_restricted = false;
    bool weekdays_restricted = false;
    bool has_seconds = false;
};

/// Days searched forward before next_occurrence() gives up.
inline constexpr int kMaxSearchDays = 8 * 366;

/// Parse a 5-field (minute hour dom month dow) or 6-field
/// (second minute hour dom month dow) cron expression string.
///
/// Supported syntax per field:
///   - `*`          all values in the field's range
///   - `N`          single value
///   - `N-M`        range from N to M inclusive
///   - `N-M/S`      range with step S
///   - `*/S`        full range with step S
///   - `N/S`        from N to the end of the range with step S
///   - `N,M,O`      list of values (each element may be a range or step)
///
/// Month names (jan-dec) and day names (sun-sat) are accepted (case-insensitive).
/// Day-of-week 7 is an alias for Sunday.
///
/// @param expr  The cron expression, e.g. "0 */2 * * 1-5".
/// @returns     Parsed CronExpression, or ErrorCode::InvalidSchedule.
auto parse_cron(std::string_view expr) -> Result<CronExpression>;

/// Find the first instant strictly after `from` whose wall-clock fields in
/// `zone` satisfy `expr`.
///
/// The search walks local calendar days, so a local time skipped by a
/// daylight-saving jump never matches and a repeated local time matches
/// once: ambiguous local times resolve to the earliest instant after
/// `from`, and a wall-clock time not later than `from`'s own wall-clock
/// time is never a candidate.
///
/// @returns  std::nullopt if nothing matches within kMaxSearchDays.
auto next_occurrence(const CronExpression& expr, Timestamp from,
                     const std::chrono::time_zone& zone) -> std::optional<Timestamp>;

/// Check whether `t`, seen as wall-clock time in `zone`, matches `expr`.
/// Sub-second components of `t` are ignored; seconds are ignored too for
/// 5-field expressions.
auto matches(const CronExpression& expr, Timestamp t,
             const std::chrono::time_zone& zone) -> bool;

} // namespace hourglass::cron
