#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "hourglass/cron/job.hpp"

using namespace hourglass;
using namespace hourglass::cron;

namespace {

auto sample_job() -> Job {
    Job job;
    job.id = "a1b2c3d4";
    job.name = "nightly report";
    job.schedule = CronSchedule{"0 2 * * *"};
    TaskRunPayload task;
    task.task_name = "report";
    task.args = json{{"format", "pdf"}, {"pages", 3}};
    job.payload = task;
    job.timezone = "Europe/Berlin";
    job.state.next_run_at_ms = 1704070800000;
    job.state.last_run_at_ms = 1703984400000;
    job.state.last_status = JobStatus::Failure;
    job.state.last_error = "exit 2";
    job.state.run_count = 7;
    job.created_at_ms = 1700000000000;
    job.updated_at_ms = 1703984400000;
    return job;
}

} // namespace

TEST_CASE("Job serialises with camelCase keys", "[cron][job]") {
    json j = sample_job();

    CHECK(j["id"] == "a1b2c3d4");
    CHECK(j["name"] == "nightly report");
    CHECK(j["enabled"] == true);
    CHECK(j["timezone"] == "Europe/Berlin");
    CHECK(j["createdAtMs"] == 1700000000000);
    CHECK(j["deleteAfterRun"] == false);

    CHECK(j["schedule"] == json{{"kind", "cron"}, {"expr", "0 2 * * *"}});

    CHECK(j["payload"]["kind"] == "task_run");
    CHECK(j["payload"]["taskName"] == "report");
    CHECK(j["payload"]["args"]["pages"] == 3);
    CHECK(j["payload"]["message"].is_null());

    CHECK(j["state"]["nextRunAtMs"] == 1704070800000);
    CHECK(j["state"]["lastStatus"] == "failure");
    CHECK(j["state"]["lastError"] == "exit 2");
    CHECK(j["state"]["runCount"] == 7);
}

TEST_CASE("Job survives a JSON round trip", "[cron][job]") {
    auto job = sample_job();
    CHECK(json(job).get<Job>() == job);

    SECTION("message payload and every schedule") {
        job.schedule = EverySchedule{60000};
        MessagePayload msg;
        msg.message = "stand-up in 5";
        msg.deliver = true;
        msg.channel = "slack";
        msg.to = "#team";
        job.payload = msg;
        job.timezone.reset();
        job.state = JobState{};
        CHECK(json(job).get<Job>() == job);
    }
}

TEST_CASE("Job accepts older layouts", "[cron][job]") {
    SECTION("snake_case keys, agent_turn payload and schedule tz") {
        auto j = json::parse(R"({
            "id": "old1",
            "name": "legacy",
            "schedule": {"kind": "every", "every_ms": 30000, "tz": "Asia/Tokyo"},
            "payload": {"kind": "agent_turn", "message": "hello"},
            "state": {"lastStatus": "ok", "runCount": 2}
        })");
        auto job = j.get<Job>();
        CHECK(job.schedule == Schedule{EverySchedule{30000}});
        REQUIRE(job.timezone.has_value());
        CHECK(*job.timezone == "Asia/Tokyo");
        REQUIRE(std::holds_alternative<MessagePayload>(job.payload));
        CHECK(std::get<MessagePayload>(job.payload).message == "hello");
        CHECK(job.state.last_status == JobStatus::Success);
        CHECK(job.state.run_count == 2);
        CHECK(job.enabled);
    }

    SECTION("task_name and error status") {
        auto j = json::parse(R"({
            "id": "old2",
            "schedule": {"kind": "at", "at_ms": 1704067200000},
            "payload": {"kind": "task_run", "task_name": "cleanup"},
            "state": {"lastStatus": "error", "lastError": "disk full"}
        })");
        auto job = j.get<Job>();
        CHECK(job.schedule == Schedule{AtSchedule{1704067200000}});
        REQUIRE(std::holds_alternative<TaskRunPayload>(job.payload));
        const auto& task = std::get<TaskRunPayload>(job.payload);
        CHECK(task.task_name == "cleanup");
        CHECK(task.args == json::object());
        CHECK(job.state.last_status == JobStatus::Failure);
    }

    SECTION("missing state defaults to never run") {
        auto j = json::parse(R"({"id": "x", "schedule": {"kind": "cron", "expr": "* * * * *"}})");
        auto job = j.get<Job>();
        CHECK(job.state == JobState{});
        CHECK_FALSE(job.timezone.has_value());
    }
}

TEST_CASE("Job rejects malformed records", "[cron][job]") {
    CHECK_THROWS_AS(json::parse(R"({"id": "x", "schedule": {"kind": "hourly"}})").get<Job>(),
                    std::invalid_argument);
    CHECK_THROWS_AS(json::parse(R"({"id": "x", "schedule": {"kind": "every"}})").get<Job>(),
                    std::invalid_argument);
    CHECK_THROWS_AS(json::parse(R"({"id": "x", "schedule": {"kind": "cron", "expr": "* * * * *"},
                                   "payload": {"kind": "task_run", "taskName": "t", "args": [1]}})").get<Job>(),
                    std::invalid_argument);
    CHECK_THROWS_AS(json::parse(R"({"id": "x", "schedule": {"kind": "every", "everyMs": "soon"}})").get<Job>(),
                    json::exception);
    CHECK_THROWS_AS(json::parse(R"({"id": "x"})").get<Job>(), json::exception);
    CHECK_THROWS_AS(json::parse("[1, 2]").get<Job>(), std::invalid_argument);
}

TEST_CASE("payload_kind and job_status_to_string", "[cron][job]") {
    CHECK(payload_kind(MessagePayload{}) == "message");
    CHECK(payload_kind(TaskRunPayload{}) == "task_run");
    CHECK(job_status_to_string(JobStatus::NeverRun) == "never_run");
    CHECK(job_status_to_string(JobStatus::Success) == "success");
    CHECK(job_status_to_string(JobStatus::Failure) == "failure");
}
