#include "hourglass/cron/job.hpp"

#include <initializer_list>
#include <stdexcept>
#include <type_traits>

namespace hourglass::cron {

namespace {

void require_object(const json& j, std::string_view what) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string(what) + " must be an object");
    }
}

/// Reads `key` into `out` when present and non-null; a value of the wrong
/// type throws.
template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->get<T>();
    } else {
        out = std::nullopt;
    }
}

/// First key present wins, so older spellings can be listed after newer ones.
auto find_any(const json& j, std::initializer_list<const char*> keys) -> const json* {
    for (const auto* key : keys) {
        if (auto it = j.find(key); it != j.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

} // anonymous namespace

auto payload_kind(const Payload& payload) -> std::string_view {
    return std::holds_alternative<MessagePayload>(payload) ? "message" : "task_run";
}

auto job_status_to_string(JobStatus status) -> std::string_view {
    switch (status) {
        case JobStatus::NeverRun: return "never_run";
        case JobStatus::Success: return "success";
        case JobStatus::Failure: return "failure";
    }
    return "never_run";
}

// ---------------------------------------------------------------------------
// Schedule
// ---------------------------------------------------------------------------

void to_json(json& j, const Schedule& schedule) {
    std::visit([&j](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, AtSchedule>) {
            j = json{{"kind", "at"}, {"atMs", s.at_ms}};
        } else if constexpr (std::is_same_v<T, EverySchedule>) {
            j = json{{"kind", "every"}, {"everyMs", s.every_ms}};
        } else {
            j = json{{"kind", "cron"}, {"expr", s.expr}};
        }
    }, schedule);
}

void from_json(const json& j, Schedule& schedule) {
    require_object(j, "schedule");
    auto kind = j.at("kind").get<std::string>();

    if (kind == "at") {
        const auto* v = find_any(j, {"atMs", "at_ms"});
        if (!v) throw std::invalid_argument("at schedule without atMs");
        schedule = AtSchedule{v->get<int64_t>()};
    } else if (kind == "every") {
        const auto* v = find_any(j, {"everyMs", "every_ms"});
        if (!v) throw std::invalid_argument("every schedule without everyMs");
        schedule = EverySchedule{v->get<int64_t>()};
    } else if (kind == "cron") {
        schedule = CronSchedule{j.at("expr").get<std::string>()};
    } else {
        throw std::invalid_argument("unknown schedule kind '" + kind + "'");
    }
}

// ---------------------------------------------------------------------------
// Payload
// ---------------------------------------------------------------------------

void to_json(json& j, const Payload& payload) {
    if (const auto* m = std::get_if<MessagePayload>(&payload)) {
        j = json{
            {"kind", "message"},
            {"message", m->message},
            {"deliver", m->deliver},
            {"channel", m->channel},
            {"to", m->to},
        };
        return;
    }

    const auto& t = std::get<TaskRunPayload>(payload);
    j = json{
        {"kind", "task_run"},
        {"taskName", t.task_name},
        {"args", t.args},
        {"message", t.message},
    };
}

void from_json(const json& j, Payload& payload) {
    require_object(j, "payload");
    auto kind = j.value("kind", std::string("message"));

    if (kind == "message" || kind == "agent_turn") {
        MessagePayload m;
        m.message = j.value("message", std::string{});
        m.deliver = j.value("deliver", false);
        read_optional(j, "channel", m.channel);
        read_optional(j, "to", m.to);
        payload = std::move(m);
    } else if (kind == "task_run") {
        TaskRunPayload t;
        const auto* name = find_any(j, {"taskName", "task_name"});
        if (!name) throw std::invalid_argument("task_run payload without taskName");
        t.task_name = name->get<std::string>();
        if (auto it = j.find("args"); it != j.end() && !it->is_null()) {
            if (!it->is_object()) throw std::invalid_argument("task_run args must be an object");
            t.args = *it;
        }
        read_optional(j, "message", t.message);
        payload = std::move(t);
    } else {
        throw std::invalid_argument("unknown payload kind '" + kind + "'");
    }
}

// ---------------------------------------------------------------------------
// JobState / Job
// ---------------------------------------------------------------------------

void to_json(json& j, const JobState& state) {
    j = json{
        {"nextRunAtMs", state.next_run_at_ms},
        {"lastRunAtMs", state.last_run_at_ms},
        {"lastStatus", state.last_status},
        {"lastError", state.last_error},
        {"runCount", state.run_count},
    };
}

void from_json(const json& j, JobState& state) {
    require_object(j, "state");
    read_optional(j, "nextRunAtMs", state.next_run_at_ms);
    read_optional(j, "lastRunAtMs", state.last_run_at_ms);
    if (auto it = j.find("lastStatus"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) throw std::invalid_argument("lastStatus must be a string");
        state.last_status = it->get<JobStatus>();
    } else {
        state.last_status = JobStatus::NeverRun;
    }
    read_optional(j, "lastError", state.last_error);
    state.run_count = j.value("runCount", int64_t{0});
}

void to_json(json& j, const Job& job) {
    j = json{
        {"id", job.id},
        {"name", job.name},
        {"enabled", job.enabled},
        {"timezone", job.timezone},
        {"createdAtMs", job.created_at_ms},
        {"updatedAtMs", job.updated_at_ms},
        {"deleteAfterRun", job.delete_after_run},
        {"schedule", job.schedule},
        {"payload", job.payload},
        {"state", job.state},
    };
}

void from_json(const json& j, Job& job) {
    require_object(j, "job");
    job.id = j.value("id", std::string{});
    job.name = j.value("name", std::string{});
    job.enabled = j.value("enabled", true);
    job.created_at_ms = j.value("createdAtMs", int64_t{0});
    job.updated_at_ms = j.value("updatedAtMs", job.created_at_ms);
    job.delete_after_run = j.value("deleteAfterRun", false);

    job.schedule = j.at("schedule").get<Schedule>();
    job.payload = j.contains("payload") ? j["payload"].get<Payload>() : Payload{};

    if (auto it = j.find("state"); it != j.end() && !it->is_null()) {
        job.state = it->get<JobState>();
    } else {
        job.state = JobState{};
    }

    // Older stores kept the zone on the schedule.
    read_optional(j, "timezone", job.timezone);
    if (!job.timezone) {
        read_optional(j.at("schedule"), "tz", job.timezone);
    }
}

} // namespace hourglass::cron
