#pragma once

#include "Result.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace Signet {

using SystemClock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Duration and timestamp helpers
 */
class TimeUtils {
public:
    /**
     * @brief Parse a duration given in seconds or with units
     *
     * A bare integer is a number of seconds ("90"). Otherwise the text is a
     * sequence of decimal numbers each followed by a unit: ns, us, µs, ms,
     * s, m, h or d ("1h30m", "1.5d"). The result is truncated to whole
     * seconds and must be positive and no longer than defaults::MAX_DURATION.
     *
     * @param text Duration text
     * @param field Field name used in the error message
     * @return InvalidDuration naming the field and the rejected text
     */
    static Result<std::chrono::seconds> parseDuration(const std::string& text,
                                                      const std::string& field = "duration");

    /**
     * @brief RFC 3339 UTC timestamp with millisecond precision
     */
    static std::string formatRfc3339(TimePoint tp);

    /**
     * @brief Parse an RFC 3339 timestamp with optional fraction and offset
     */
    static Result<TimePoint> parseRfc3339(const std::string& text);

    /// Truncate to whole milliseconds
    static TimePoint floorMillis(TimePoint tp);

    /// Truncate to whole seconds
    static TimePoint floorSeconds(TimePoint tp);

    static int64_t toUnixMillis(TimePoint tp);
    static TimePoint fromUnixMillis(int64_t millis);
    static int64_t toUnixSeconds(TimePoint tp);
};

} // namespace Signet
