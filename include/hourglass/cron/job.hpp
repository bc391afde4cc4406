#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "hourglass/core/types.hpp"
#include "hourglass/cron/schedule.hpp"

namespace hourglass::cron {

/// Free-text content handed to the message executor.
struct MessagePayload {
    std::string message;
    bool deliver = false;
    std::optional<std::string> channel;
    std::optional<std::string> to;

    auto operator==(const MessagePayload&) const -> bool = default;
};

/// A named task plus its arguments.
struct TaskRunPayload {
    std::string task_name;
    json args = json::object();
    std::optional<std::string> message;

    auto operator==(const TaskRunPayload&) const -> bool = default;
};

using Payload = std::variant<MessagePayload, TaskRunPayload>;

/// "message" or "task_run".
auto payload_kind(const Payload& payload) -> std::string_view;

enum class JobStatus {
    NeverRun,
    Success,
    Failure,
};

// "ok"/"error" are older spellings; the first entry per value wins on write.
NLOHMANN_JSON_SERIALIZE_ENUM(JobStatus, {
    {JobStatus::NeverRun, "never_run"},
    {JobStatus::Success, "success"},
    {JobStatus::Failure, "failure"},
    {JobStatus::Success, "ok"},
    {JobStatus::Failure, "error"},
})

auto job_status_to_string(JobStatus status) -> std::string_view;

/// Mutable run state, owned by the cron service.
struct JobState {
    std::optional<int64_t> next_run_at_ms;  // null: will not fire again
    std::optional<int64_t> last_run_at_ms;
    JobStatus last_status = JobStatus::NeverRun;
    std::optional<std::string> last_error;
    int64_t run_count = 0;

    auto operator==(const JobState&) const -> bool = default;
};

struct Job {
    std::string id;
    std::string name;
    Schedule schedule;
    Payload payload;
    bool enabled = true;
    std::optional<std::string> timezone;  // falls back to the service default
    JobState state;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;
    bool delete_after_run = false;  // one-shot jobs only

    auto operator==(const Job&) const -> bool = default;
};

// JSON layout of the job store (camelCase keys). from_json accepts the
// older layouts as well. It throws json::exception on type mismatches and
// std::invalid_argument on unknown kinds or non-object records.
void to_json(json& j, const Schedule& schedule);
void from_json(const json& j, Schedule& schedule);
void to_json(json& j, const Payload& payload);
void from_json(const json& j, Payload& payload);
void to_json(json& j, const JobState& state);
void from_json(const json& j, JobState& state);
void to_json(json& j, const Job& job);
void from_json(const json& j, Job& job);

} // namespace hourglass::cron
