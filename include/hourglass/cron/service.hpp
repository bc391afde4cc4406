#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "hourglass/core/config.hpp"
#include "hourglass/core/error.hpp"
#include "hourglass/cron/job.hpp"
#include "hourglass/cron/store.hpp"
#include "hourglass/hooks/registry.hpp"

namespace hourglass::cron {

using boost::asio::awaitable;

/// Runs a job's payload. Supplied by the host; the service never looks
/// inside the payload. Exceptions count as failures.
using PayloadExecutor =
    std::function<awaitable<VoidResult>(Payload payload, std::string job_id)>;

/// Lifecycle events raised through the hook registry.
inline constexpr std::string_view kBeforeRun = "before_run";
inline constexpr std::string_view kAfterRun = "after_run";
inline constexpr std::string_view kRunFailed = "run_failed";

struct AddJobRequest {
    std::string name;
    Schedule schedule;
    Payload payload;
    std::optional<std::string> timezone;
    bool delete_after_run = false;
};

/// Fields left unset keep their current value.
struct JobUpdate {
    std::optional<std::string> name;
    std::optional<Schedule> schedule;
    std::optional<Payload> payload;
    std::optional<std::string> timezone;  // "" clears the override
    std::optional<bool> delete_after_run;
};

/// Parameters for listing jobs with paging/filtering.
struct ListParams {
    int limit = 50;                      // <= 0: no limit
    int offset = 0;
    std::optional<std::string> query;    // name filter, case-insensitive
    std::optional<bool> enabled;         // enabled filter
    std::string sort_by = "next_run";    // "next_run", "name", "created_at"
    std::string sort_dir = "asc";        // "asc", "desc"
};

struct ServiceStatus {
    bool running = false;
    std::size_t jobs = 0;
    std::size_t enabled_jobs = 0;
    std::optional<int64_t> next_wake_at_ms;
};

/// Persistent job scheduler.
///
/// Owns the in-memory job set (mirrored to a JobStore), exposes CRUD, and
/// runs the dispatch tick. All state lives behind one mutex that is never
/// held across a suspension point, so CRUD calls from other threads are
/// serialized against the tick. Payload execution and hooks run on the
/// io_context passed at construction.
class CronService {
public:
    struct Options {
        std::string default_timezone = "UTC";
        std::chrono::milliseconds tick_interval{1000};
        std::chrono::milliseconds job_timeout{300000};
        std::chrono::milliseconds hook_timeout{200};
        std::function<int64_t()> clock;  // ms since epoch; wall clock if empty
        bool persist_on_load = true;     // write normalised records back in load()

        static auto from_config(const CronConfig& config) -> Options;
    };

    CronService(boost::asio::io_context& ioc, JobStore store, PayloadExecutor executor,
                Options options);
    ~CronService();

    CronService(const CronService&) = delete;
    CronService& operator=(const CronService&) = delete;

    /// Read the store and prepare jobs for dispatch. Fails with
    /// ErrorCode::StoreCorrupt when the store cannot be read.
    auto load() -> VoidResult;

    /// Create a job, compute its first run and persist it.
    auto add_job(AddJobRequest request) -> Result<Job>;

    auto update_job(std::string_view id, const JobUpdate& update) -> Result<Job>;
    auto remove_job(std::string_view id) -> VoidResult;
    auto enable_job(std::string_view id) -> Result<Job>;
    auto disable_job(std::string_view id) -> Result<Job>;

    [[nodiscard]] auto get_job(std::string_view id) const -> Result<Job>;

    /// Snapshot of all jobs, earliest next run first (never-firing last).
    [[nodiscard]] auto list_jobs() const -> std::vector<Job>;
    [[nodiscard]] auto list_jobs(const ListParams& params) const -> std::vector<Job>;

    /// One tick: dispatch every enabled job due at `now_ms` that is not
    /// still running from an earlier tick, persist once, and return the
    /// dispatched ids in due order.
    auto run_due(int64_t now_ms) -> awaitable<std::vector<std::string>>;

    /// Dispatch one job immediately. Disabled jobs need `force`.
    auto run_job(std::string id, bool force = false) -> awaitable<Result<Job>>;

    /// Tick loop; returns after stop(). Each tick is spawned on the
    /// io_context, so a slow job does not hold back the next tick.
    auto start() -> awaitable<void>;

    /// Ask the tick loop to exit. Safe to call from any thread.
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool;
    [[nodiscard]] auto status() const -> ServiceStatus;

    [[nodiscard]] auto hooks() -> hooks::HookRegistry& { return hooks_; }
    [[nodiscard]] auto options() const -> const Options& { return options_; }

private:
    auto current_time_ms() const -> int64_t;
    auto timezone_for(const Job& job) const -> std::string;
    auto find_locked(std::string_view id) -> Result<JobMap::iterator>;

    /// Replace the job set with `next` if it can be persisted.
    auto commit_locked(JobMap next) -> VoidResult;
    void persist_locked();

    /// Run one job through hooks and the executor and record the outcome.
    /// Returns the job as recorded, or nothing if it was removed meanwhile.
    auto dispatch(Job job, int64_t now_ms) -> awaitable<std::optional<Job>>;
    auto dispatch_in_tick(Job job, int64_t now_ms) -> awaitable<void>;
    /// Applies `outcome` to the job's state. Rescheduling is skipped when
    /// the job's schedule no longer equals `dispatched`.
    void record_outcome_locked(JobMap::iterator it, const VoidResult& outcome,
                               int64_t now_ms, const Schedule& dispatched);

    boost::asio::io_context& ioc_;
    JobStore store_;
    PayloadExecutor executor_;
    Options options_;
    hooks::HookRegistry hooks_;

    mutable std::mutex mutex_;
    JobMap jobs_;
    std::unordered_set<std::string> in_flight_;  // ids dispatched by a tick

    std::atomic<bool> running_{false};
    boost::asio::steady_timer tick_timer_;
};

} // namespace hourglass::cron
