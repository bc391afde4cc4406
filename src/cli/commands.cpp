#include "hourglass/cli/commands.hpp"
#include "hourglass/core/logger.hpp"
#include "hourglass/core/utils.hpp"
#include "hourglass/cron/service.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef HOURGLASS_VERSION_STRING
#define HOURGLASS_VERSION_STRING "0.1.0-dev"
#endif

namespace hourglass::cli {

namespace {

/// Stand-in for real delivery: message and task payloads are logged.
auto logging_executor(cron::Payload payload, std::string job_id)
    -> boost::asio::awaitable<VoidResult>
{
    if (const auto* msg = std::get_if<cron::MessagePayload>(&payload)) {
        if (msg->deliver) {
            LOG_INFO("[{}] deliver to {}:{}: {}", job_id,
                     msg->channel.value_or("default"), msg->to.value_or("-"),
                     msg->message);
        } else {
            LOG_INFO("[{}] message: {}", job_id, msg->message);
        }
    } else {
        const auto& task = std::get<cron::TaskRunPayload>(payload);
        LOG_INFO("[{}] run task '{}' args={}", job_id, task.task_name, task.args.dump());
    }
    co_return ok_result();
}

/// Read-only hosts keep load() normalisation in memory.
auto open_service(boost::asio::io_context& ioc, const Config& config, bool read_only = false)
    -> std::unique_ptr<cron::CronService>
{
    auto store_path = resolve_store_path(config);
    LOG_DEBUG("Using job store {}", store_path.string());
    auto options = cron::CronService::Options::from_config(config.cron);
    options.persist_on_load = !read_only;
    return std::make_unique<cron::CronService>(
        ioc, cron::JobStore(store_path), logging_executor, std::move(options));
}

auto report(const Error& err) -> int {
    std::cerr << "Error [" << error_code_to_string(err.code()) << "]: "
              << err.what() << "\n";
    return 1;
}

auto job_timezone(const cron::Job& job, const Config& config) -> std::string {
    return job.timezone.value_or(config.cron.default_timezone);
}

void print_jobs(const std::vector<cron::Job>& jobs, const Config& config) {
    if (jobs.empty()) {
        std::cout << "No scheduled jobs.\n";
        return;
    }

    std::cout << fmt::format("{:<10} {:<24} {:<24} {:<10} {}\n",
                             "ID", "NAME", "SCHEDULE", "STATUS", "NEXT RUN");
    for (const auto& job : jobs) {
        auto tz = job_timezone(job, config);
        std::string status = job.enabled
            ? std::string(cron::job_status_to_string(job.state.last_status))
            : "disabled";
        std::string next = job.state.next_run_at_ms
            ? cron::format_local(*job.state.next_run_at_ms, tz) + " " + tz
            : "-";
        std::cout << fmt::format("{:<10} {:<24} {:<24} {:<10} {}\n",
                                 job.id, job.name,
                                 cron::describe_schedule(job.schedule), status, next);
    }
}

// ---------------------------------------------------------------------------
// cron add
// ---------------------------------------------------------------------------

// A century; keeps `seconds * 1000` and `now + seconds * 1000` in range.
constexpr int64_t kMaxScheduleSeconds = int64_t{100} * 366 * 24 * 3600;

struct AddOptions {
    std::string name;
    std::string message;
    std::string task;
    std::string args;
    int64_t every_seconds = 0;
    std::string cron_expr;
    std::string at;
    int64_t in_seconds = 0;
    std::string tz;
    bool deliver = false;
    std::string channel;
    std::string to;
    bool delete_after_run = false;
};

auto build_request(const AddOptions& opts, const Config& config)
    -> Result<cron::AddJobRequest>
{
    cron::AddJobRequest request;
    request.name = utils::trim(opts.name);
    request.delete_after_run = opts.delete_after_run;
    if (!opts.tz.empty()) {
        request.timezone = opts.tz;
    }
    auto tz = opts.tz.empty() ? config.cron.default_timezone : opts.tz;

    int schedules = (opts.every_seconds > 0) + !opts.cron_expr.empty() +
                    !opts.at.empty() + (opts.in_seconds > 0);
    if (schedules != 1) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Give exactly one of --every, --cron, --at, --in"));
    }

    if (opts.every_seconds > 0) {
        request.schedule = cron::EverySchedule{opts.every_seconds * 1000};
    } else if (!opts.cron_expr.empty()) {
        request.schedule = cron::CronSchedule{opts.cron_expr};
    } else if (!opts.at.empty()) {
        auto at_ms = cron::parse_local_datetime(opts.at, tz);
        if (!at_ms) return std::unexpected(at_ms.error());
        request.schedule = cron::AtSchedule{*at_ms};
    } else {
        request.schedule = cron::AtSchedule{utils::timestamp_ms() + opts.in_seconds * 1000};
    }

    if (!opts.task.empty()) {
        cron::TaskRunPayload task;
        task.task_name = opts.task;
        if (!opts.message.empty()) task.message = opts.message;
        if (!opts.args.empty()) {
            auto args = json::parse(opts.args, nullptr, false);
            if (args.is_discarded() || !args.is_object()) {
                return std::unexpected(make_error(
                    ErrorCode::InvalidArgument,
                    "--args must be a JSON object", opts.args));
            }
            task.args = std::move(args);
        }
        request.payload = std::move(task);
    } else if (!opts.message.empty()) {
        cron::MessagePayload msg;
        msg.message = opts.message;
        msg.deliver = opts.deliver;
        if (!opts.channel.empty()) msg.channel = opts.channel;
        if (!opts.to.empty()) msg.to = opts.to;
        request.payload = std::move(msg);
    } else {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Give --message or --task"));
    }

    return request;
}

void register_add_command(CLI::App& cron_cmd, CommandContext& ctx) {
    auto* sub = cron_cmd.add_subcommand("add", "Add a scheduled job");
    auto opts = std::make_shared<AddOptions>();

    sub->add_option("-n,--name", opts->name, "Job name")->required();
    auto* message = sub->add_option("-m,--message", opts->message, "Message to send");
    auto* task = sub->add_option("-t,--task", opts->task, "Task to run");
    sub->add_option("--args", opts->args, "Task arguments (JSON object)")->needs(task);
    sub->add_option("-e,--every", opts->every_seconds, "Run every N seconds")
        ->check(CLI::Range(int64_t{1}, kMaxScheduleSeconds));
    sub->add_option("--cron", opts->cron_expr, "Cron expression, e.g. '0 9 * * *'");
    sub->add_option("--at", opts->at, "Run once at local time YYYY-MM-DDTHH:MM[:SS]");
    sub->add_option("--in", opts->in_seconds, "Run once N seconds from now")
        ->check(CLI::Range(int64_t{1}, kMaxScheduleSeconds));
    sub->add_option("--tz", opts->tz, "IANA timezone for this job");
    sub->add_flag("-d,--deliver", opts->deliver, "Deliver the message to a channel")
        ->needs(message);
    sub->add_option("--channel", opts->channel, "Delivery channel");
    sub->add_option("--to", opts->to, "Delivery recipient");
    sub->add_flag("--delete-after-run", opts->delete_after_run,
                  "Remove a one-shot job after it runs");

    sub->callback([&ctx, opts]() {
        ctx.action = [&ctx, opts]() -> int {
            auto request = build_request(*opts, ctx.config);
            if (!request) return report(request.error());

            boost::asio::io_context ioc;
            auto service = open_service(ioc, ctx.config);
            if (auto loaded = service->load(); !loaded) return report(loaded.error());

            auto job = service->add_job(std::move(*request));
            if (!job) return report(job.error());

            std::cout << "Added job '" << job->name << "' (" << job->id << "), next run "
                      << cron::format_local(*job->state.next_run_at_ms,
                                            job_timezone(*job, ctx.config))
                      << "\n";
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// cron list / remove / enable / run
// ---------------------------------------------------------------------------

void register_list_command(CLI::App& cron_cmd, CommandContext& ctx) {
    auto* sub = cron_cmd.add_subcommand("list", "List scheduled jobs");
    auto all = std::make_shared<bool>(false);
    sub->add_flag("-a,--all", *all, "Include disabled jobs");

    sub->callback([&ctx, all]() {
        ctx.action = [&ctx, all]() -> int {
            boost::asio::io_context ioc;
            auto service = open_service(ioc, ctx.config, true);
            if (auto loaded = service->load(); !loaded) return report(loaded.error());

            cron::ListParams params;
            params.limit = 0;
            if (!*all) params.enabled = true;
            print_jobs(service->list_jobs(params), ctx.config);
            return 0;
        };
    });
}

void register_remove_command(CLI::App& cron_cmd, CommandContext& ctx) {
    auto* sub = cron_cmd.add_subcommand("remove", "Remove a scheduled job");
    auto id = std::make_shared<std::string>();
    sub->add_option("id", *id, "Job ID")->required();

    sub->callback([&ctx, id]() {
        ctx.action = [&ctx, id]() -> int {
            boost::asio::io_context ioc;
            auto service = open_service(ioc, ctx.config);
            if (auto loaded = service->load(); !loaded) return report(loaded.error());

            if (auto removed = service->remove_job(*id); !removed) {
                return report(removed.error());
            }
            std::cout << "Removed job " << *id << "\n";
            return 0;
        };
    });
}

void register_enable_command(CLI::App& cron_cmd, CommandContext& ctx) {
    struct EnableOptions {
        std::string id;
        bool disable = false;
    };

    auto* sub = cron_cmd.add_subcommand("enable", "Enable or disable a job");
    auto opts = std::make_shared<EnableOptions>();
    sub->add_option("id", opts->id, "Job ID")->required();
    sub->add_flag("--disable", opts->disable, "Disable instead of enable");

    sub->callback([&ctx, opts]() {
        ctx.action = [&ctx, opts]() -> int {
            boost::asio::io_context ioc;
            auto service = open_service(ioc, ctx.config);
            if (auto loaded = service->load(); !loaded) return report(loaded.error());

            auto job = opts->disable ? service->disable_job(opts->id)
                                     : service->enable_job(opts->id);
            if (!job) return report(job.error());

            std::cout << "Job '" << job->name << "' "
                      << (opts->disable ? "disabled" : "enabled") << "\n";
            return 0;
        };
    });
}

void register_run_command(CLI::App& cron_cmd, CommandContext& ctx) {
    struct RunOptions {
        std::string id;
        bool force = false;
    };

    auto* sub = cron_cmd.add_subcommand("run", "Run a job now");
    auto opts = std::make_shared<RunOptions>();
    sub->add_option("id", opts->id, "Job ID")->required();
    sub->add_flag("-f,--force", opts->force, "Run even if disabled");

    sub->callback([&ctx, opts]() {
        ctx.action = [&ctx, opts]() -> int {
            boost::asio::io_context ioc;
            auto service = open_service(ioc, ctx.config);
            if (auto loaded = service->load(); !loaded) return report(loaded.error());

            int code = 1;
            boost::asio::co_spawn(ioc, service->run_job(opts->id, opts->force),
                [&code](std::exception_ptr ep, Result<cron::Job> job) {
                    if (ep) {
                        std::cerr << "Error: job run threw\n";
                        return;
                    }
                    if (!job) {
                        code = report(job.error());
                        return;
                    }
                    std::cout << "Ran job '" << job->name << "': "
                              << cron::job_status_to_string(job->state.last_status);
                    if (job->state.last_error) {
                        std::cout << " (" << *job->state.last_error << ")";
                    }
                    std::cout << "\n";
                    code = job->state.last_status == cron::JobStatus::Success ? 0 : 1;
                });
            ioc.run();
            return code;
        };
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// daemon command
// ---------------------------------------------------------------------------

void register_daemon_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("daemon", "Run the scheduler in the foreground");

    sub->callback([&ctx]() {
        ctx.action = [&ctx]() -> int {
            auto& config = ctx.config;
            if (auto valid = validate_config(config); !valid) {
                return report(valid.error());
            }
            if (!config.cron.enabled) {
                LOG_WARN("Cron is disabled in configuration, nothing to do");
                return 0;
            }

            // Set up the Boost.Asio io_context and signal handling.
            boost::asio::io_context ioc;
            boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);

            auto service = open_service(ioc, config);
            if (auto loaded = service->load(); !loaded) {
                LOG_FATAL("Cannot load job store: {}", loaded.error().what());
                return report(loaded.error());
            }

            service->hooks().register_hook(hooks::HookRegistry::kAnyEvent,
                [](json payload) -> boost::asio::awaitable<void> {
                    LOG_DEBUG("Cron event: {}", payload.dump());
                    co_return;
                },
                "event-log", hooks::HookPriority::Lowest);

            signals.async_wait([&service](auto ec, auto /*sig*/) {
                if (!ec) {
                    LOG_INFO("Received shutdown signal");
                    service->stop();
                }
            });

            boost::asio::co_spawn(ioc, service->start(),
                [&signals](std::exception_ptr ep) {
                    if (ep) {
                        LOG_ERROR("Cron loop terminated unexpectedly");
                    }
                    signals.cancel();
                });

            auto st = service->status();
            LOG_INFO("Scheduler running with {} job(s), {} enabled. Press Ctrl+C to stop.",
                     st.jobs, st.enabled_jobs);
            ioc.run();

            LOG_INFO("Scheduler stopped.");
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// cron command group
// ---------------------------------------------------------------------------

void register_cron_commands(CLI::App& app, CommandContext& ctx) {
    auto* cron_cmd = app.add_subcommand("cron", "Manage scheduled jobs");
    cron_cmd->require_subcommand(1);

    register_list_command(*cron_cmd, ctx);
    register_add_command(*cron_cmd, ctx);
    register_remove_command(*cron_cmd, ctx);
    register_enable_command(*cron_cmd, ctx);
    register_run_command(*cron_cmd, ctx);
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&ctx, validate_only]() {
        ctx.action = [&ctx, validate_only]() -> int {
            const auto& cfg = ctx.config;

            if (*validate_only) {
                if (auto valid = validate_config(cfg); !valid) {
                    return report(valid.error());
                }
                std::cout << "Configuration is valid.\n";
                return 0;
            }

            json j = cfg;
            j["resolved_store_path"] = resolve_store_path(cfg).string();
            std::cout << j.dump(2) << "\n";
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([&ctx]() {
        ctx.action = []() -> int {
            std::cout << "hourglass " << HOURGLASS_VERSION_STRING << "\n";
            std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
            std::cout << "Compiler: clang " << __clang_major__ << "."
                      << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
            std::cout << "Compiler: gcc " << __GNUC__ << "."
                      << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
            std::cout << "Compiler: unknown\n";
#endif
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// status command
// ---------------------------------------------------------------------------

void register_status_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("status", "Show scheduler status");

    sub->callback([&ctx]() {
        ctx.action = [&ctx]() -> int {
            const auto& config = ctx.config;
            boost::asio::io_context ioc;
            auto service = open_service(ioc, config, true);
            if (auto loaded = service->load(); !loaded) return report(loaded.error());

            auto st = service->status();
            std::cout << "Store: " << resolve_store_path(config).string() << "\n";
            std::cout << "  Cron enabled: " << (config.cron.enabled ? "yes" : "no") << "\n";
            std::cout << "  Default timezone: " << config.cron.default_timezone << "\n";
            std::cout << "  Jobs: " << st.jobs << " (" << st.enabled_jobs << " enabled)\n";
            if (st.next_wake_at_ms) {
                std::cout << "  Next run: "
                          << cron::format_local(*st.next_wake_at_ms,
                                                config.cron.default_timezone)
                          << " " << config.cron.default_timezone << "\n";
            } else {
                std::cout << "  Next run: -\n";
            }
            return 0;
        };
    });
}

} // namespace hourglass::cli
