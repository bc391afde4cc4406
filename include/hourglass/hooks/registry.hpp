#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "hourglass/core/types.hpp"

namespace hourglass::hooks {

using boost::asio::awaitable;

/// An observer callback. It receives its own copy of the event payload and
/// may suspend; it cannot reach back into the scheduler.
using Hook = std::function<awaitable<void>(json payload)>;

/// A blocking observer, run on the registry's worker pool.
using SyncHook = std::function<void(const json& payload)>;

/// Priority levels for hook ordering.
enum class HookPriority : int {
    Highest = 0,
    High    = 100,
    Normal  = 500,
    Low     = 900,
    Lowest  = 1000,
};

/// A single registered hook entry with its metadata.
struct HookEntry {
    std::string name;
    Hook hook;
    HookPriority priority = HookPriority::Normal;
    uint64_t seq = 0;  // registration order
};

struct HookStats {
    uint64_t invoked = 0;
    uint64_t failed = 0;
    uint64_t timed_out = 0;
};

/// Maps event names to observer callbacks and fires them with isolation.
///
/// Callbacks for an event run one after another in priority order (lowest
/// numeric value first), registration order within a priority. Hooks
/// registered for the wildcard event "*" run for every event. Each call is
/// bounded by the registry's timeout; a callback that throws or overruns is
/// logged and counted, and the next callback still runs.
class HookRegistry {
public:
    static constexpr std::string_view kAnyEvent = "*";
    static constexpr std::chrono::milliseconds kDefaultTimeout{200};

    explicit HookRegistry(std::chrono::milliseconds timeout = kDefaultTimeout,
                          std::size_t sync_threads = 2);
    ~HookRegistry();

    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;

    /// Register a suspending callback. An empty name gets a generated one.
    void register_hook(std::string_view event, Hook hook, std::string name = {},
                       HookPriority priority = HookPriority::Normal);

    /// Register a blocking callback; it runs off the caller's executor so the
    /// same timeout applies.
    void register_sync_hook(std::string_view event, SyncHook hook, std::string name = {},
                            HookPriority priority = HookPriority::Normal);

    /// Remove a named hook from an event. Returns false if none matched.
    auto remove_hook(std::string_view event, std::string_view name) -> bool;

    /// Invoke every callback registered for `event` (and "*").
    /// Never throws; waits at most count(event) * timeout().
    auto trigger(std::string_view event, json payload) -> awaitable<void>;

    /// Number of callbacks `event` would run, including wildcard hooks.
    [[nodiscard]] auto count(std::string_view event) const -> std::size_t;

    [[nodiscard]] auto stats() const -> HookStats;
    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds { return timeout_; }

    /// Clear all hooks.
    void clear();

private:
    using HookList = std::vector<HookEntry>;

    void insert_sorted(std::string_view event, HookEntry entry);
    auto collect_hooks(std::string_view event) const -> HookList;

    std::chrono::milliseconds timeout_;
    boost::asio::thread_pool sync_pool_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, HookList> hooks_;
    uint64_t next_seq_ = 0;
    HookStats stats_;
};

} // namespace hourglass::hooks
