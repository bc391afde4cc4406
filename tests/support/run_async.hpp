#pragma once

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace hourglass::test {

/// Spawn `op` on `ioc`, run the context until it is out of work, and return
/// the coroutine's value (rethrowing anything it threw).
template <typename T>
auto run_async(boost::asio::io_context& ioc, boost::asio::awaitable<T> op) -> T {
    std::optional<T> result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(op),
        [&](std::exception_ptr ep, T value) {
            error = ep;
            if (!ep) result.emplace(std::move(value));
        });
    ioc.restart();
    ioc.run();
    if (error) std::rethrow_exception(error);
    return std::move(*result);
}

inline void run_async(boost::asio::io_context& ioc, boost::asio::awaitable<void> op) {
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(op),
        [&](std::exception_ptr ep) { error = ep; });
    ioc.restart();
    ioc.run();
    if (error) std::rethrow_exception(error);
}

/// Fresh, empty directory under the system temp dir.
inline auto fresh_temp_dir(const std::string& name) -> std::filesystem::path {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace hourglass::test
