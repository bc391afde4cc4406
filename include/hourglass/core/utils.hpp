#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hourglass::utils {

auto generate_uuid() -> std::string;
auto timestamp_ms() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;

/// Case-insensitive substring test (ASCII).
auto icontains(std::string_view haystack, std::string_view needle) -> bool;

} // namespace hourglass::utils
