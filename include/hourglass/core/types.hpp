#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json: absent or null keys map to
// std::nullopt, engaged optionals serialise as their value.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace hourglass {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

/// Milliseconds since the Unix epoch -> Timestamp.
inline auto from_epoch_ms(int64_t ms) -> Timestamp {
    return Timestamp{std::chrono::milliseconds{ms}};
}

/// Timestamp -> milliseconds since the Unix epoch.
inline auto to_epoch_ms(Timestamp ts) -> int64_t {
    return ts.time_since_epoch().count();
}

} // namespace hourglass
