#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace gitsaga::timeutil {

// Milliseconds since the Unix epoch (used for collision-breaking name suffixes).
auto now_millis() -> std::int64_t;

// "2024-04-29T17:12:25.123Z" for the given instant, always UTC.
auto iso8601_utc(std::chrono::system_clock::time_point when) -> std::string;

// iso8601_utc(now)
auto now_iso8601() -> std::string;

} // namespace gitsaga::timeutil
