/**
 * @file time_utils.cpp
 * @brief RFC 3339 formatting and parsing
 */

#include "ptet/utils/time_utils.h"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace ptet {
namespace utils {

namespace {

bool readDigits(const std::string& text, size_t pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    return true;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    if (month == 2 && leap) {
        return 29;
    }
    return days[month - 1];
}

} // anonymous namespace

std::string formatRfc3339(const TimePoint& tp) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
    long nanos = static_cast<long>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(tp - seconds).count());

    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm_time{};
    gmtime_r(&time, &tm_time);

    char buffer[48];
    int len = std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d",
                            tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
                            tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec);

    // Shortest exact fraction of 3, 6 or 9 digits
    if (nanos % 1000000 == 0 && nanos != 0) {
        len += std::snprintf(buffer + len, sizeof(buffer) - len, ".%03ld", nanos / 1000000);
    } else if (nanos % 1000 == 0 && nanos != 0) {
        len += std::snprintf(buffer + len, sizeof(buffer) - len, ".%06ld", nanos / 1000);
    } else if (nanos != 0) {
        len += std::snprintf(buffer + len, sizeof(buffer) - len, ".%09ld", nanos);
    }
    std::snprintf(buffer + len, sizeof(buffer) - len, "Z");
    return std::string(buffer);
}

std::optional<TimePoint> parseRfc3339(const std::string& text) {
    int year, month, day, hour, minute, second;

    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 20 ||
        !readDigits(text, 0, 4, year) || text[4] != '-' ||
        !readDigits(text, 5, 2, month) || text[7] != '-' ||
        !readDigits(text, 8, 2, day)) {
        return std::nullopt;
    }
    char sep = text[10];
    if (sep != 'T' && sep != 't' && sep != ' ') {
        return std::nullopt;
    }
    if (!readDigits(text, 11, 2, hour) || text[13] != ':' ||
        !readDigits(text, 14, 2, minute) || text[16] != ':' ||
        !readDigits(text, 17, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    long fractionNanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t fractionStart = pos;
        long scale = 100000000;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            // digits below one nanosecond are dropped
            fractionNanos += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == fractionStart) {
            return std::nullopt;
        }
    }

    if (pos >= text.size()) {
        return std::nullopt;
    }

    long offsetSeconds = 0;
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        int offHour, offMinute;
        if (!readDigits(text, pos + 1, 2, offHour) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !readDigits(text, pos + 4, 2, offMinute) ||
            offHour > 23 || offMinute > 59) {
            return std::nullopt;
        }
        offsetSeconds = (offHour * 3600L + offMinute * 60L) * (zone == '+' ? 1 : -1);
        pos += 6;
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm_time{};
    tm_time.tm_year = year - 1900;
    tm_time.tm_mon = month - 1;
    tm_time.tm_mday = day;
    tm_time.tm_hour = hour;
    tm_time.tm_min = minute;
    tm_time.tm_sec = second;
    tm_time.tm_isdst = 0;

    std::time_t time = timegm(&tm_time);
    return std::chrono::system_clock::from_time_t(time - offsetSeconds) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(
               std::chrono::nanoseconds(fractionNanos));
}

int64_t toUnixSeconds(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixSeconds(int64_t seconds) {
    return TimePoint(std::chrono::seconds(seconds));
}

} // namespace utils
} // namespace ptet
