#include "common/TimeUtils.h"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace rebalex {
namespace utils {

namespace {
bool readInt(const std::string& text, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}
}

std::optional<long long> TimeUtils::parseIsoUtcMs(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readInt(text, 0, 4, year) || text.size() < 19 || text[4] != '-' ||
        !readInt(text, 5, 2, month) || text[7] != '-' ||
        !readInt(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ') ||
        !readInt(text, 11, 2, hour) || text[13] != ':' ||
        !readInt(text, 14, 2, minute) || text[16] != ':' ||
        !readInt(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    long long millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long scale = 100;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    long long offset_minutes = 0;
    if (pos < text.size()) {
        const char tz = text[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            int oh = 0, om = 0;
            if (!readInt(text, pos + 1, 2, oh)) {
                return std::nullopt;
            }
            std::size_t mpos = pos + 3;
            if (mpos < text.size() && text[mpos] == ':') {
                ++mpos;
            }
            if (mpos < text.size() && !readInt(text, mpos, 2, om)) {
                return std::nullopt;
            }
            offset_minutes = (tz == '-' ? -1 : 1) * (oh * 60 + om);
            pos = text.size();
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const long long seconds = static_cast<long long>(timegm(&tm));
    return (seconds - offset_minutes * 60) * 1000 + millis;
}

std::string TimeUtils::formatIsoUtc(long long epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buffer;
}

bool TimeUtils::isMarketOpen(long long epoch_ms, const MarketSession& session) {
    const long long local_ms = epoch_ms + static_cast<long long>(session.utc_offset_minutes) * 60 * 1000;
    std::time_t seconds = static_cast<std::time_t>(local_ms / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    if (session.weekdays_only && (tm.tm_wday == 0 || tm.tm_wday == 6)) {
        return false;
    }
    const int minute_of_day = tm.tm_hour * 60 + tm.tm_min;
    return minute_of_day >= session.open_minute && minute_of_day < session.close_minute;
}

} // namespace utils
} // namespace rebalex
