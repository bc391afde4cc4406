#include "hourglass/cron/parser.hpp"
#include "hourglass/core/logger.hpp"
#include "hourglass/core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <unordered_map>

namespace hourglass::cron {

namespace {

// ---------------------------------------------------------------------------
// Named value maps
// ---------------------------------------------------------------------------

const std::unordered_map<std::string, int> kMonthNames = {
    {"jan", 1}, {"feb", 2},  {"mar", 3},  {"apr", 4},
    {"may", 5}, {"jun", 6},  {"jul", 7},  {"aug", 8},
    {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12},
};

const std::unordered_map<std::string, int> kDayNames = {
    {"sun", 0}, {"mon", 1}, {"tue", 2}, {"wed", 3},
    {"thu", 4}, {"fri", 5}, {"sat", 6},
};

/// Bounds and accepted names of one cron field.
struct FieldSpec {
    std::string_view label;
    int min;
    int max;
    const std::unordered_map<std::string, int>* names = nullptr;
};

const FieldSpec kSecondField{"second", 0, 59};
const FieldSpec kMinuteField{"minute", 0, 59};
const FieldSpec kHourField{"hour", 0, 23};
const FieldSpec kDayField{"day-of-month", 1, 31};
const FieldSpec kMonthField{"month", 1, 12, &kMonthNames};
const FieldSpec kWeekdayField{"day-of-week", 0, 7, &kDayNames};

auto field_error(const FieldSpec& spec, std::string message, std::string_view token) -> Error {
    return make_error(ErrorCode::InvalidSchedule, std::move(message),
                      std::string(spec.label) + " field '" + std::string(token) + "'");
}

auto parse_int(std::string_view token) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

/// A number or a month/day name, checked against the field's bounds.
auto parse_bound(std::string_view token, const FieldSpec& spec) -> Result<int> {
    std::optional<int> value;
    if (spec.names) {
        if (auto it = spec.names->find(utils::to_lower(token)); it != spec.names->end()) {
            value = it->second;
        }
    }
    if (!value) value = parse_int(token);
    if (!value) {
        return std::unexpected(field_error(spec, "Invalid cron value", token));
    }
    if (*value < spec.min || *value > spec.max) {
        return std::unexpected(field_error(
            spec,
            "Cron value out of range " + std::to_string(spec.min) + "-" + std::to_string(spec.max),
            token));
    }
    return *value;
}

/// Append the values of one list element: `*`, `N` or `N-M`, each with an
/// optional `/S` step. `N/S` runs from N to the end of the field.
auto expand_element(std::string_view elem, const FieldSpec& spec, std::vector<int>& out)
    -> VoidResult
{
    const auto whole = elem;
    int step = 1;
    bool stepped = false;
    if (auto slash = elem.find('/'); slash != std::string_view::npos) {
        auto parsed = parse_int(elem.substr(slash + 1));
        if (!parsed || *parsed <= 0) {
            return std::unexpected(field_error(spec, "Invalid step value", whole));
        }
        step = *parsed;
        stepped = true;
        elem = elem.substr(0, slash);
    }

    int lo = spec.min;
    int hi = spec.max;
    if (elem != "*") {
        auto dash = elem.find('-');
        auto first = parse_bound(elem.substr(0, dash), spec);
        if (!first) return std::unexpected(first.error());
        lo = *first;

        if (dash != std::string_view::npos) {
            auto last = parse_bound(elem.substr(dash + 1), spec);
            if (!last) return std::unexpected(last.error());
            if (*last < lo) {
                return std::unexpected(field_error(spec, "Invalid range", whole));
            }
            hi = *last;
        } else if (!stepped) {
            hi = lo;
        }
    }

    for (int v = lo;; v += step) {
        out.push_back(v);
        if (step > hi - v) break;
    }
    return {};
}

/// Comma-separated list of elements, sorted and deduplicated.
auto parse_field(std::string_view field, const FieldSpec& spec) -> Result<std::vector<int>> {
    std::vector<int> values;
    for (const auto& part : utils::split(field, ',')) {
        if (part.empty()) {
            return std::unexpected(field_error(spec, "Empty cron list element", field));
        }
        if (auto expanded = expand_element(part, spec, values); !expanded) {
            return std::unexpected(expanded.error());
        }
    }

    std::ranges::sort(values);
    auto dupes = std::ranges::unique(values);
    values.erase(dupes.begin(), dupes.end());
    return values;
}

auto tokenize(std::string_view s) -> std::vector<std::string_view> {
    constexpr std::string_view kBlank = " \t";
    std::vector<std::string_view> tokens;
    auto pos = s.find_first_not_of(kBlank);
    while (pos != std::string_view::npos) {
        auto end = s.find_first_of(kBlank, pos);
        tokens.push_back(s.substr(pos, end == std::string_view::npos ? end : end - pos));
        pos = end == std::string_view::npos ? end : s.find_first_not_of(kBlank, end);
    }
    return tokens;
}

auto contains(const std::vector<int>& v, int val) -> bool {
    return std::binary_search(v.begin(), v.end(), val);
}

auto day_matches(const CronExpression& expr, const std::chrono::year_month_day& ymd,
                 std::chrono::weekday wd) -> bool
{
    if (!contains(expr.months, static_cast<int>(static_cast<unsigned>(ymd.month())))) {
        return false;
    }
    bool dom = contains(expr.days, static_cast<int>(static_cast<unsigned>(ymd.day())));
    bool dow = contains(expr.weekdays, static_cast<int>(wd.c_encoding()));
    if (expr.days_restricted && expr.weekdays_restricted) {
        return dom || dow;
    }
    return dom && dow;
}

/// Map a wall-clock time to the instant it denotes, if that instant is
/// strictly after `after`. Skipped local times yield nothing.
auto resolve_local(const std::chrono::time_zone& zone, std::chrono::local_seconds local,
                   Timestamp after) -> std::optional<Timestamp>
{
    using namespace std::chrono;

    auto to_instant = [&](const sys_info& info) {
        return time_point_cast<milliseconds>(
            sys_seconds{local.time_since_epoch() - info.offset});
    };

    auto info = zone.get_info(local);
    switch (info.result) {
        case local_info::unique: {
            auto t = to_instant(info.first);
            if (t > after) return t;
            return std::nullopt;
        }
        case local_info::nonexistent:
            return std::nullopt;
        case local_info::ambiguous: {
            auto earlier = to_instant(info.first);
            if (earlier > after) return earlier;
            auto later = to_instant(info.second);
            if (later > after) return later;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

auto parse_cron(std::string_view expr) -> Result<CronExpression> {
    auto fields = tokenize(expr);
    if (fields.size() != 5 && fields.size() != 6) {
        return std::unexpected(make_error(
            ErrorCode::InvalidSchedule,
            "Cron expression must have 5 or 6 fields",
            "got " + std::to_string(fields.size()) + " in '" + std::string(expr) + "'"));
    }

    CronExpression parsed;
    std::size_t i = 0;
    if (fields.size() == 6) {
        auto seconds = parse_field(fields[i++], kSecondField);
        if (!seconds) return std::unexpected(seconds.error());
        parsed.seconds = std::move(*seconds);
        parsed.has_seconds = true;
    }

    struct Target {
        const FieldSpec& spec;
        std::vector<int>& values;
    };
    const Target targets[] = {
        {kMinuteField, parsed.minutes},
        {kHourField, parsed.hours},
        {kDayField, parsed.days},
        {kMonthField, parsed.months},
        {kWeekdayField, parsed.weekdays},
    };
    const auto day_field = fields[i + 2];
    const auto weekday_field = fields[i + 4];
    for (const auto& target : targets) {
        auto values = parse_field(fields[i++], target.spec);
        if (!values) return std::unexpected(values.error());
        target.values = std::move(*values);
    }

    // 7 is Sunday as well; it sorts last, so fold it onto 0.
    if (!parsed.weekdays.empty() && parsed.weekdays.back() == 7) {
        parsed.weekdays.pop_back();
        if (parsed.weekdays.empty() || parsed.weekdays.front() != 0) {
            parsed.weekdays.insert(parsed.weekdays.begin(), 0);
        }
    }

    parsed.days_restricted = !day_field.starts_with('*');
    parsed.weekdays_restricted = !weekday_field.starts_with('*');
    return parsed;
}

auto matches(const CronExpression& expr, Timestamp t,
             const std::chrono::time_zone& zone) -> bool
{
    using namespace std::chrono;

    auto local = floor<seconds>(zone.to_local(t));
    auto day = floor<days>(local);
    hh_mm_ss hms{local - day};

    if (!day_matches(expr, year_month_day{day}, weekday{day})) {
        return false;
    }
    if (expr.has_seconds && !contains(expr.seconds, static_cast<int>(hms.seconds().count()))) {
        return false;
    }
    return contains(expr.hours, static_cast<int>(hms.hours().count())) &&
           contains(expr.minutes, static_cast<int>(hms.minutes().count()));
}

auto next_occurrence(const CronExpression& expr, Timestamp from,
                     const std::chrono::time_zone& zone) -> std::optional<Timestamp>
{
    using namespace std::chrono;

    const auto from_local = zone.to_local(from);
    auto day = floor<days>(from_local);

    for (int i = 0; i < kMaxSearchDays; ++i, day += days{1}) {
        if (!day_matches(expr, year_month_day{day}, weekday{day})) {
            continue;
        }

        for (int hour : expr.hours) {
            const auto hour_start = local_seconds{day} + std::chrono::hours{hour};
            if (hour_start + std::chrono::hours{1} <= from_local) continue;

            for (int minute : expr.minutes) {
                const auto minute_start = hour_start + std::chrono::minutes{minute};
                if (minute_start + std::chrono::minutes{1} <= from_local) continue;

                for (int second : expr.seconds) {
                    const auto candidate = minute_start + std::chrono::seconds{second};
                    if (candidate <= from_local) continue;

                    if (auto instant = resolve_local(zone, candidate, from)) {
                        return instant;
                    }
                }
            }
        }
    }

    LOG_DEBUG("next_occurrence found no match within {} days", kMaxSearchDays);
    return std::nullopt;
}

} // namespace hourglass::cron
