#include "hourglass/hooks/registry.hpp"

#include "hourglass/core/async.hpp"
#include "hourglass/core/logger.hpp"

#include <algorithm>

namespace hourglass::hooks {

namespace {

auto entry_before(const HookEntry& a, const HookEntry& b) -> bool {
    if (a.priority != b.priority) {
        return static_cast<int>(a.priority) < static_cast<int>(b.priority);
    }
    return a.seq < b.seq;
}

/// Owns the callback for the lifetime of the call, so an abandoned
/// (timed-out) callback never outlives its closure.
auto invoke_hook(Hook hook, json payload) -> awaitable<void> {
    co_await hook(std::move(payload));
}

} // anonymous namespace

HookRegistry::HookRegistry(std::chrono::milliseconds timeout, std::size_t sync_threads)
    : timeout_(timeout)
    , sync_pool_(sync_threads)
{
}

HookRegistry::~HookRegistry() {
    sync_pool_.join();
}

// -- Registration --

void HookRegistry::insert_sorted(std::string_view event, HookEntry entry) {
    auto& list = hooks_[std::string(event)];
    auto it = std::ranges::upper_bound(list, entry, entry_before);
    list.insert(it, std::move(entry));
}

void HookRegistry::register_hook(std::string_view event, Hook hook, std::string name,
                                 HookPriority priority) {
    if (event.empty()) {
        LOG_WARN("Ignoring hook '{}' registered without an event name", name);
        return;
    }
    if (!hook) {
        LOG_WARN("Ignoring empty hook '{}' for event '{}'", name, event);
        return;
    }

    std::lock_guard lock(mutex_);
    auto seq = next_seq_++;
    if (name.empty()) {
        name = "hook-" + std::to_string(seq);
    }
    LOG_DEBUG("Registering hook '{}' for event '{}'", name, event);
    insert_sorted(event, HookEntry{std::move(name), std::move(hook), priority, seq});
}

void HookRegistry::register_sync_hook(std::string_view event, SyncHook hook,
                                      std::string name, HookPriority priority) {
    if (!hook) {
        LOG_WARN("Ignoring empty hook '{}' for event '{}'", name, event);
        return;
    }

    auto& pool = sync_pool_;
    register_hook(event,
        [&pool, hook = std::move(hook)](json payload) -> awaitable<void> {
            co_await async::offload(pool, [hook, payload = std::move(payload)] {
                hook(payload);
            });
        },
        std::move(name), priority);
}

// -- Removal --

auto HookRegistry::remove_hook(std::string_view event, std::string_view name) -> bool {
    std::lock_guard lock(mutex_);
    auto it = hooks_.find(std::string(event));
    if (it == hooks_.end()) return false;

    auto erased = std::erase_if(it->second, [&](const HookEntry& e) {
        return e.name == name;
    });
    return erased > 0;
}

// -- Collecting hooks: merge wildcard + event-specific, sorted by priority --

auto HookRegistry::collect_hooks(std::string_view event) const -> HookList {
    std::lock_guard lock(mutex_);
    HookList merged;

    if (auto it = hooks_.find(std::string(kAnyEvent)); it != hooks_.end()) {
        merged.insert(merged.end(), it->second.begin(), it->second.end());
    }

    if (event != kAnyEvent) {
        if (auto it = hooks_.find(std::string(event)); it != hooks_.end()) {
            merged.insert(merged.end(), it->second.begin(), it->second.end());
        }
    }

    std::ranges::sort(merged, entry_before);
    return merged;
}

// -- Dispatch --

auto HookRegistry::trigger(std::string_view event, json payload) -> awaitable<void> {
    std::string event_name(event);
    auto hooks = collect_hooks(event_name);
    if (hooks.empty()) co_return;

    for (const auto& entry : hooks) {
        {
            std::lock_guard lock(mutex_);
            ++stats_.invoked;
        }

        auto result = co_await async::with_timeout(
            invoke_hook(entry.hook, payload), timeout_);
        if (result) continue;

        std::lock_guard lock(mutex_);
        if (result.error().code() == ErrorCode::Timeout) {
            ++stats_.timed_out;
            LOG_WARN("Hook '{}' for '{}' timed out after {}ms",
                     entry.name, event_name, timeout_.count());
        } else {
            ++stats_.failed;
            LOG_WARN("Hook '{}' for '{}' failed: {}",
                     entry.name, event_name, result.error().what());
        }
    }
}

auto HookRegistry::count(std::string_view event) const -> std::size_t {
    std::lock_guard lock(mutex_);
    std::size_t total = 0;
    if (auto it = hooks_.find(std::string(kAnyEvent)); it != hooks_.end()) {
        total += it->second.size();
    }
    if (event != kAnyEvent) {
        if (auto it = hooks_.find(std::string(event)); it != hooks_.end()) {
            total += it->second.size();
        }
    }
    return total;
}

auto HookRegistry::stats() const -> HookStats {
    std::lock_guard lock(mutex_);
    return stats_;
}

void HookRegistry::clear() {
    std::lock_guard lock(mutex_);
    hooks_.clear();
}

} // namespace hourglass::hooks
