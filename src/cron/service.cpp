#include "hourglass/cron/service.hpp"

#include "hourglass/core/async.hpp"
#include "hourglass/core/logger.hpp"
#include "hourglass/core/utils.hpp"

#include <algorithm>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace hourglass::cron {

namespace {

/// Owns the executor for the lifetime of the call, so a run abandoned on
/// timeout never outlives it.
auto call_executor(PayloadExecutor executor, Payload payload, std::string job_id)
    -> awaitable<VoidResult>
{
    if (!executor) {
        co_return make_fail(make_error(ErrorCode::ExecutionFailed,
                                       "No payload executor configured"));
    }
    co_return co_await executor(std::move(payload), std::move(job_id));
}

auto event_payload(std::string_view event, const Job& job, int64_t timestamp) -> json {
    return json{
        {"event", std::string(event)},
        {"job_id", job.id},
        {"timestamp", timestamp},
        {"name", job.name},
        {"payload_kind", std::string(payload_kind(job.payload))},
    };
}

/// Drops a job id from the in-flight set when its tick dispatch ends.
struct InFlightRelease {
    std::mutex& mutex;
    std::unordered_set<std::string>& in_flight;
    std::string id;

    ~InFlightRelease() {
        std::lock_guard lock(mutex);
        in_flight.erase(id);
    }
};

/// Earliest next run first; jobs that will not fire sort last.
auto by_next_run(const Job& a, const Job& b) -> bool {
    const auto& na = a.state.next_run_at_ms;
    const auto& nb = b.state.next_run_at_ms;
    if (na.has_value() != nb.has_value()) return na.has_value();
    if (na && *na != *nb) return *na < *nb;
    return a.id < b.id;
}

auto validate_payload(const Payload& payload) -> VoidResult {
    if (const auto* task = std::get_if<TaskRunPayload>(&payload)) {
        if (task->task_name.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument, "task_run payload needs a task name"));
        }
        if (!task->args.is_object()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument, "task_run args must be a JSON object"));
        }
    }
    return {};
}

/// First run of a freshly (re)armed job; an elapsed one-shot cannot be armed.
auto arm(const Schedule& schedule, int64_t now, const std::string& tz) -> Result<int64_t> {
    auto next = compute_next(schedule, now, tz);
    if (!next) return std::unexpected(next.error());
    if (!*next) {
        return std::unexpected(make_error(
            ErrorCode::InvalidSchedule,
            is_one_shot(schedule) ? "One-shot time has already passed"
                                  : "Schedule has no future occurrence",
            describe_schedule(schedule)));
    }
    return **next;
}

} // anonymous namespace

auto CronService::Options::from_config(const CronConfig& config) -> Options {
    Options options;
    options.default_timezone = config.default_timezone;
    options.tick_interval = std::chrono::milliseconds(config.tick_interval_ms);
    options.job_timeout = std::chrono::milliseconds(config.job_timeout_ms);
    options.hook_timeout = std::chrono::milliseconds(config.hook_timeout_ms);
    return options;
}

CronService::CronService(boost::asio::io_context& ioc, JobStore store,
                         PayloadExecutor executor, Options options)
    : ioc_(ioc)
    , store_(std::move(store))
    , executor_(std::move(executor))
    , options_(std::move(options))
    , hooks_(options_.hook_timeout)
    , tick_timer_(ioc)
{
}

CronService::~CronService() {
    running_.store(false, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

auto CronService::current_time_ms() const -> int64_t {
    return options_.clock ? options_.clock() : utils::timestamp_ms();
}

auto CronService::timezone_for(const Job& job) const -> std::string {
    if (job.timezone && !job.timezone->empty()) return *job.timezone;
    return options_.default_timezone;
}

auto CronService::find_locked(std::string_view id) -> Result<JobMap::iterator> {
    auto it = jobs_.find(std::string(id));
    if (it == jobs_.end()) {
        return std::unexpected(make_error(
            ErrorCode::JobNotFound, "No cron job with this id", std::string(id)));
    }
    return it;
}

auto CronService::commit_locked(JobMap next) -> VoidResult {
    if (auto saved = store_.save(next); !saved) {
        LOG_ERROR("Failed to persist cron jobs: {}", saved.error().what());
        return saved;
    }
    jobs_ = std::move(next);
    return {};
}

void CronService::persist_locked() {
    if (auto saved = store_.save(jobs_); !saved) {
        LOG_ERROR("Failed to persist cron jobs: {}", saved.error().what());
    }
}

// ---------------------------------------------------------------------------
// Load / CRUD
// ---------------------------------------------------------------------------

auto CronService::load() -> VoidResult {
    auto loaded = store_.load();
    if (!loaded) return std::unexpected(loaded.error());

    auto now = current_time_ms();
    bool changed = false;

    for (auto& [id, job] : *loaded) {
        if (!job.enabled) {
            if (job.state.next_run_at_ms) {
                job.state.next_run_at_ms.reset();
                changed = true;
            }
            continue;
        }

        auto tz = timezone_for(job);
        if (auto valid = validate_schedule(job.schedule, tz); !valid) {
            LOG_WARN("Disabling cron job '{}' ({}): {}", job.name, id, valid.error().what());
            job.enabled = false;
            job.state.next_run_at_ms.reset();
            job.state.last_error = valid.error().what();
            changed = true;
            continue;
        }

        if (job.state.next_run_at_ms) continue;

        if (is_one_shot(job.schedule)) {
            // Never dispatched: arm it, even if late, so it fires once.
            if (job.state.run_count == 0) {
                job.state.next_run_at_ms = std::get<AtSchedule>(job.schedule).at_ms;
                changed = true;
            }
            continue;
        }

        auto next = compute_next(job.schedule, now, tz);
        if (next && *next) {
            job.state.next_run_at_ms = **next;
            changed = true;
        }
    }

    std::lock_guard lock(mutex_);
    jobs_ = std::move(*loaded);
    if (changed && options_.persist_on_load) persist_locked();

    LOG_INFO("Cron service loaded {} job(s)", jobs_.size());
    return {};
}

auto CronService::add_job(AddJobRequest request) -> Result<Job> {
    if (request.name.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Job name must not be empty"));
    }
    if (auto valid = validate_payload(request.payload); !valid) {
        return std::unexpected(valid.error());
    }

    Job job;
    job.name = std::move(request.name);
    job.schedule = std::move(request.schedule);
    job.payload = std::move(request.payload);
    if (request.timezone && !request.timezone->empty()) {
        job.timezone = std::move(request.timezone);
    }
    job.delete_after_run = request.delete_after_run && is_one_shot(job.schedule);

    auto tz = timezone_for(job);
    if (auto valid = validate_schedule(job.schedule, tz); !valid) {
        return std::unexpected(valid.error());
    }

    auto now = current_time_ms();
    auto next = arm(job.schedule, now, tz);
    if (!next) return std::unexpected(next.error());

    job.enabled = true;
    job.state.next_run_at_ms = *next;
    job.created_at_ms = now;
    job.updated_at_ms = now;

    std::lock_guard lock(mutex_);
    do {
        job.id = utils::generate_uuid().substr(0, 8);
    } while (jobs_.contains(job.id));

    auto next_jobs = jobs_;
    next_jobs.emplace(job.id, job);
    if (auto saved = commit_locked(std::move(next_jobs)); !saved) {
        return std::unexpected(saved.error());
    }

    LOG_INFO("Added cron job '{}' ({}) {}, next run {}", job.name, job.id,
             describe_schedule(job.schedule), *job.state.next_run_at_ms);
    return job;
}

auto CronService::update_job(std::string_view id, const JobUpdate& update) -> Result<Job> {
    std::lock_guard lock(mutex_);
    auto it = find_locked(id);
    if (!it) return std::unexpected(it.error());

    Job job = (*it)->second;
    if (update.name) {
        if (update.name->empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument, "Job name must not be empty"));
        }
        job.name = *update.name;
    }
    if (update.payload) {
        if (auto valid = validate_payload(*update.payload); !valid) {
            return std::unexpected(valid.error());
        }
        job.payload = *update.payload;
    }
    if (update.schedule) {
        job.schedule = *update.schedule;
    }
    if (update.timezone) {
        if (update.timezone->empty()) {
            job.timezone.reset();
        } else {
            job.timezone = *update.timezone;
        }
    }
    if (update.delete_after_run) {
        job.delete_after_run = *update.delete_after_run;
    }
    job.delete_after_run = job.delete_after_run && is_one_shot(job.schedule);

    auto now = current_time_ms();
    if (update.schedule || update.timezone) {
        auto tz = timezone_for(job);
        if (auto valid = validate_schedule(job.schedule, tz); !valid) {
            return std::unexpected(valid.error());
        }
        if (job.enabled) {
            auto next = arm(job.schedule, now, tz);
            if (!next) return std::unexpected(next.error());
            job.state.next_run_at_ms = *next;
        }
    }
    job.updated_at_ms = now;

    auto next_jobs = jobs_;
    next_jobs[job.id] = job;
    if (auto saved = commit_locked(std::move(next_jobs)); !saved) {
        return std::unexpected(saved.error());
    }

    LOG_INFO("Updated cron job '{}' ({})", job.name, job.id);
    return job;
}

auto CronService::remove_job(std::string_view id) -> VoidResult {
    std::lock_guard lock(mutex_);
    auto it = find_locked(id);
    if (!it) return std::unexpected(it.error());

    auto name = (*it)->second.name;
    auto next_jobs = jobs_;
    next_jobs.erase(std::string(id));
    if (auto saved = commit_locked(std::move(next_jobs)); !saved) {
        return saved;
    }

    LOG_INFO("Removed cron job '{}' ({})", name, id);
    return {};
}

auto CronService::enable_job(std::string_view id) -> Result<Job> {
    std::lock_guard lock(mutex_);
    auto it = find_locked(id);
    if (!it) return std::unexpected(it.error());

    Job job = (*it)->second;
    if (job.enabled && job.state.next_run_at_ms) {
        return job;
    }

    auto now = current_time_ms();
    auto next = arm(job.schedule, now, timezone_for(job));
    if (!next) return std::unexpected(next.error());

    job.enabled = true;
    job.state.next_run_at_ms = *next;
    job.updated_at_ms = now;

    auto next_jobs = jobs_;
    next_jobs[job.id] = job;
    if (auto saved = commit_locked(std::move(next_jobs)); !saved) {
        return std::unexpected(saved.error());
    }

    LOG_INFO("Enabled cron job '{}' ({}), next run {}", job.name, job.id,
             *job.state.next_run_at_ms);
    return job;
}

auto CronService::disable_job(std::string_view id) -> Result<Job> {
    std::lock_guard lock(mutex_);
    auto it = find_locked(id);
    if (!it) return std::unexpected(it.error());

    Job job = (*it)->second;
    job.enabled = false;
    job.state.next_run_at_ms.reset();
    job.updated_at_ms = current_time_ms();

    auto next_jobs = jobs_;
    next_jobs[job.id] = job;
    if (auto saved = commit_locked(std::move(next_jobs)); !saved) {
        return std::unexpected(saved.error());
    }

    LOG_INFO("Disabled cron job '{}' ({})", job.name, job.id);
    return job;
}

auto CronService::get_job(std::string_view id) const -> Result<Job> {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(std::string(id));
    if (it == jobs_.end()) {
        return std::unexpected(make_error(
            ErrorCode::JobNotFound, "No cron job with this id", std::string(id)));
    }
    return it->second;
}

auto CronService::list_jobs() const -> std::vector<Job> {
    std::vector<Job> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(jobs_.size());
        for (const auto& [_, job] : jobs_) {
            result.push_back(job);
        }
    }
    std::ranges::sort(result, by_next_run);
    return result;
}

auto CronService::list_jobs(const ListParams& params) const -> std::vector<Job> {
    auto all = list_jobs();

    std::erase_if(all, [&](const Job& job) {
        if (params.enabled && job.enabled != *params.enabled) return true;
        if (params.query && !params.query->empty() &&
            !utils::icontains(job.name, *params.query)) {
            return true;
        }
        return false;
    });

    if (params.sort_by == "name") {
        std::ranges::stable_sort(all, [](const Job& a, const Job& b) {
            return a.name < b.name;
        });
    } else if (params.sort_by == "created_at") {
        std::ranges::stable_sort(all, [](const Job& a, const Job& b) {
            return a.created_at_ms < b.created_at_ms;
        });
    }
    if (params.sort_dir == "desc") {
        std::ranges::reverse(all);
    }

    auto offset = static_cast<std::size_t>(std::max(params.offset, 0));
    if (offset >= all.size()) return {};
    all.erase(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(offset));

    if (params.limit > 0 && all.size() > static_cast<std::size_t>(params.limit)) {
        all.resize(static_cast<std::size_t>(params.limit));
    }
    return all;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

void CronService::record_outcome_locked(JobMap::iterator it, const VoidResult& outcome,
                                        int64_t now_ms, const Schedule& dispatched) {
    auto& job = it->second;
    auto& state = job.state;

    state.run_count += 1;
    state.last_run_at_ms = now_ms;
    if (outcome) {
        state.last_status = JobStatus::Success;
        state.last_error.reset();
    } else {
        state.last_status = JobStatus::Failure;
        state.last_error = outcome.error().what();
    }

    // update_job() already armed the new schedule.
    if (job.schedule != dispatched) {
        LOG_DEBUG("Cron job '{}' ({}) was rescheduled while running", job.name, job.id);
        return;
    }

    if (is_one_shot(job.schedule)) {
        job.enabled = false;
        state.next_run_at_ms.reset();
        return;
    }
    if (!job.enabled) {
        state.next_run_at_ms.reset();
        return;
    }

    auto next = compute_next(job.schedule, now_ms, timezone_for(job));
    if (!next) {
        LOG_WARN("Cron job '{}' ({}) cannot be rescheduled: {}",
                 job.name, job.id, next.error().what());
        state.next_run_at_ms.reset();
        return;
    }
    state.next_run_at_ms = *next;
}

auto CronService::dispatch(Job job, int64_t now_ms) -> awaitable<std::optional<Job>> {
    co_await hooks_.trigger(kBeforeRun, event_payload(kBeforeRun, job, now_ms));

    LOG_DEBUG("Dispatching cron job '{}' ({}) [{}]", job.name, job.id,
              payload_kind(job.payload));
    auto started = std::chrono::steady_clock::now();

    auto result = co_await async::with_timeout(
        call_executor(executor_, job.payload, job.id), options_.job_timeout);
    VoidResult outcome = result ? *result : VoidResult(std::unexpected(result.error()));

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (!outcome) {
        LOG_WARN("Cron job '{}' ({}) failed: {}", job.name, job.id, outcome.error().what());
    }

    std::optional<Job> recorded;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(job.id);
        if (it == jobs_.end()) {
            LOG_INFO("Cron job {} was removed while running, outcome dropped", job.id);
        } else {
            record_outcome_locked(it, outcome, now_ms, job.schedule);
            recorded = it->second;
            if (is_one_shot(it->second.schedule) && it->second.delete_after_run &&
                it->second.schedule == job.schedule) {
                jobs_.erase(it);
                LOG_INFO("Deleted one-shot cron job '{}' ({}) after run", job.name, job.id);
            }
        }
    }
    if (!recorded) co_return std::nullopt;

    auto event = outcome ? kAfterRun : kRunFailed;
    auto payload = event_payload(event, *recorded, now_ms);
    payload["status"] = std::string(job_status_to_string(recorded->state.last_status));
    payload["error"] = recorded->state.last_error;
    payload["duration_ms"] = duration_ms;
    payload["run_count"] = recorded->state.run_count;
    payload["next_run_at_ms"] = recorded->state.next_run_at_ms;
    co_await hooks_.trigger(event, std::move(payload));

    co_return recorded;
}

auto CronService::dispatch_in_tick(Job job, int64_t now_ms) -> awaitable<void> {
    InFlightRelease release{mutex_, in_flight_, job.id};
    co_await dispatch(std::move(job), now_ms);
}

auto CronService::run_due(int64_t now_ms) -> awaitable<std::vector<std::string>> {
    std::vector<Job> due;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [_, job] : jobs_) {
            if (job.enabled && job.state.next_run_at_ms &&
                *job.state.next_run_at_ms <= now_ms && !in_flight_.contains(job.id)) {
                due.push_back(job);
            }
        }
        for (const auto& job : due) {
            in_flight_.insert(job.id);
        }
    }
    if (due.empty()) co_return std::vector<std::string>{};

    std::ranges::sort(due, by_next_run);

    std::vector<std::string> ids;
    std::vector<awaitable<void>> runs;
    ids.reserve(due.size());
    runs.reserve(due.size());
    for (auto& job : due) {
        ids.push_back(job.id);
        runs.push_back(dispatch_in_tick(std::move(job), now_ms));
    }

    co_await async::when_all(std::move(runs));

    {
        std::lock_guard lock(mutex_);
        persist_locked();
    }

    LOG_DEBUG("Cron tick at {} dispatched {} job(s)", now_ms, ids.size());
    co_return ids;
}

auto CronService::run_job(std::string id, bool force) -> awaitable<Result<Job>> {
    Job snapshot;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            co_return make_fail(make_error(
                ErrorCode::JobNotFound, "No cron job with this id", id));
        }
        if (!it->second.enabled && !force) {
            co_return make_fail(make_error(
                ErrorCode::InvalidArgument, "Job is disabled, use force to run it", id));
        }
        snapshot = it->second;
    }

    LOG_INFO("Manually running cron job '{}' ({})", snapshot.name, id);
    auto recorded = co_await dispatch(std::move(snapshot), current_time_ms());

    {
        std::lock_guard lock(mutex_);
        persist_locked();
    }

    if (!recorded) {
        co_return make_fail(make_error(
            ErrorCode::JobNotFound, "Job was removed while running", id));
    }
    co_return std::move(*recorded);
}

// ---------------------------------------------------------------------------
// Tick loop
// ---------------------------------------------------------------------------

auto CronService::start() -> awaitable<void> {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        LOG_WARN("Cron service already running");
        co_return;
    }
    LOG_INFO("Cron service started (tick {}ms)", options_.tick_interval.count());

    while (running_.load(std::memory_order_acquire)) {
        boost::asio::co_spawn(ioc_, run_due(current_time_ms()),
            [](std::exception_ptr ep, std::vector<std::string> /*ids*/) {
                if (ep) {
                    LOG_ERROR("Cron tick failed: {}", async::detail::describe_exception(ep));
                }
            });

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        tick_timer_.expires_after(options_.tick_interval);
        boost::system::error_code ec;
        co_await tick_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec && ec != boost::asio::error::operation_aborted) {
            LOG_WARN("Cron timer error: {}", ec.message());
        }
    }

    LOG_INFO("Cron service stopped");
}

void CronService::stop() {
    if (running_.exchange(false, std::memory_order_acq_rel)) {
        LOG_INFO("Cron service stopping...");
        boost::asio::post(ioc_, [this] { tick_timer_.cancel(); });
    }
}

auto CronService::is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
}

auto CronService::status() const -> ServiceStatus {
    ServiceStatus status;
    status.running = is_running();

    std::lock_guard lock(mutex_);
    status.jobs = jobs_.size();
    for (const auto& [_, job] : jobs_) {
        if (!job.enabled) continue;
        ++status.enabled_jobs;
        const auto& next = job.state.next_run_at_ms;
        if (next && (!status.next_wake_at_ms || *next < *status.next_wake_at_ms)) {
            status.next_wake_at_ms = next;
        }
    }
    return status;
}

} // namespace hourglass::cron
