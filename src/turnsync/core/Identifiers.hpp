#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace TS {

// Random RFC 4122 version 4 identifier in canonical lowercase form.
[[nodiscard]] auto generateUuid() -> std::string;
[[nodiscard]] auto isUuid(std::string_view text) -> bool;

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z.
[[nodiscard]] auto formatTimestamp(std::chrono::system_clock::time_point tp) -> std::string;
[[nodiscard]] auto nowTimestamp() -> std::string;
[[nodiscard]] auto toMillis(std::chrono::system_clock::time_point tp) -> std::uint64_t;

} // namespace TS
