#include "TimeUtils.h"
#include "Constants.h"
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <limits>

namespace Signet {

namespace {

constexpr int64_t NANOS_PER_SECOND = 1000000000LL;

struct UnitScale {
    const char* name;
    int64_t nanos;
};

// Matched longest-first so "ms" wins over "m"
const UnitScale UNITS[] = {
    {"ns", 1LL},
    {"us", 1000LL},
    {"\xc2\xb5s", 1000LL},      // U+00B5 micro sign
    {"\xce\xbcs", 1000LL},      // U+03BC greek mu
    {"ms", 1000000LL},
    {"s", NANOS_PER_SECOND},
    {"m", 60 * NANOS_PER_SECOND},
    {"h", 3600 * NANOS_PER_SECOND},
    {"d", 86400 * NANOS_PER_SECOND},
};

bool isAllDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool addChecked(int64_t& total, int64_t value) {
    if (value > std::numeric_limits<int64_t>::max() - total) {
        return false;
    }
    total += value;
    return true;
}

// Parses "<digits>[.<digits>]<unit>" repeated, in nanoseconds
bool parseUnitSequence(const std::string& text, int64_t& nanos) {
    size_t pos = 0;
    nanos = 0;
    if (text.empty()) {
        return false;
    }

    while (pos < text.size()) {
        int64_t whole = 0;
        size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (whole > (std::numeric_limits<int64_t>::max() - 9) / 10) {
                return false;
            }
            whole = whole * 10 + (text[pos] - '0');
            ++pos;
        }
        bool hasWhole = pos > start;

        int64_t fraction = 0;
        int64_t fractionScale = 1;
        bool hasFraction = false;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                // Digits beyond nanosecond precision cannot change the result
                if (fractionScale < NANOS_PER_SECOND * 100) {
                    fraction = fraction * 10 + (text[pos] - '0');
                    fractionScale *= 10;
                }
                hasFraction = true;
                ++pos;
            }
        }
        if (!hasWhole && !hasFraction) {
            return false;
        }

        const UnitScale* unit = nullptr;
        for (const auto& candidate : UNITS) {
            size_t len = std::char_traits<char>::length(candidate.name);
            if (text.compare(pos, len, candidate.name) == 0) {
                if (!unit || len > std::char_traits<char>::length(unit->name)) {
                    unit = &candidate;
                }
            }
        }
        if (!unit) {
            return false;
        }
        pos += std::char_traits<char>::length(unit->name);

        if (whole > std::numeric_limits<int64_t>::max() / unit->nanos) {
            return false;
        }
        int64_t value = whole * unit->nanos;
        if (fraction > 0) {
            long double part = static_cast<long double>(fraction) * unit->nanos / fractionScale;
            value += static_cast<int64_t>(part);
        }
        if (!addChecked(nanos, value)) {
            return false;
        }
    }
    return true;
}

} // namespace

Result<std::chrono::seconds> TimeUtils::parseDuration(const std::string& text, const std::string& field) {
    auto invalid = [&]() {
        return Error{ErrorCode::InvalidDuration, "unable to parse provided " + field + " of: " + text};
    };

    int64_t seconds = 0;
    if (isAllDigits(text)) {
        if (text.size() > 18) {
            return invalid();
        }
        seconds = std::stoll(text);
    } else {
        std::string body = text;
        if (!body.empty() && body[0] == '+') {
            body.erase(0, 1);
        }
        int64_t nanos = 0;
        if (!parseUnitSequence(body, nanos)) {
            return invalid();
        }
        seconds = nanos / NANOS_PER_SECOND;
    }

    if (seconds <= 0 || seconds > defaults::MAX_DURATION.count()) {
        return invalid();
    }
    return std::chrono::seconds(seconds);
}

std::string TimeUtils::formatRfc3339(TimePoint tp) {
    int64_t millis = toUnixMillis(tp);
    int64_t secs = millis / 1000;
    int64_t rem = millis % 1000;
    if (rem < 0) {
        rem += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(rem));
    return buf;
}

Result<TimePoint> TimeUtils::parseRfc3339(const std::string& text) {
    auto invalid = Error{ErrorCode::SerializationFailed, "invalid RFC 3339 timestamp: " + text};

    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 || consumed != 19) {
        return invalid;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return invalid;
    }

    size_t pos = 19;
    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return invalid;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int offHour = 0, offMinute = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &offHour, &offMinute) != 2
            || text.size() != pos + 6) {
            return invalid;
        }
        offsetSeconds = (offHour * 3600 + offMinute * 60) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return invalid;
    }
    if (pos != text.size()) {
        return invalid;
    }

    struct tm tm_buf {};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t t = timegm(&tm_buf);

    int64_t unixMillis = (static_cast<int64_t>(t) - offsetSeconds) * 1000 + millis;
    return fromUnixMillis(unixMillis);
}

TimePoint TimeUtils::floorMillis(TimePoint tp) {
    return fromUnixMillis(toUnixMillis(tp));
}

TimePoint TimeUtils::floorSeconds(TimePoint tp) {
    return TimePoint(std::chrono::duration_cast<SystemClock::duration>(
        std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch())));
}

int64_t TimeUtils::toUnixMillis(TimePoint tp) {
    return std::chrono::floor<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint TimeUtils::fromUnixMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds(millis)));
}

int64_t TimeUtils::toUnixSeconds(TimePoint tp) {
    return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace Signet
