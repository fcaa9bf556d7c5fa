#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace clouddrive
{

    using TimePoint = std::chrono::system_clock::time_point;

    // Accepts RFC 3339 / ISO 8601 as emitted by Graph, e.g. "2025-01-15T10:30:00.1234567Z" or "...+02:00".
    std::optional<TimePoint> parse_timestamp(std::string_view text);

    // Always UTC with second precision: "2025-01-15T10:30:00Z".
    std::string format_timestamp(TimePoint time);

} // namespace clouddrive
