#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace livelink
{
    using WallClock = std::chrono::system_clock;
    using WallTime  = WallClock::time_point;

    // RFC3339 in UTC with millisecond precision, e.g. 2024-05-01T12:30:45.123Z
    std::string formatRfc3339(WallTime tp);

    // Accepts "Z" or "+hh:mm"/"-hh:mm" offsets and an optional fractional second.
    std::optional<WallTime> parseRfc3339(const std::string& text);

} // namespace livelink
