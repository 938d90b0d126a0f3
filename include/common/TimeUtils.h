#pragma once

#include <optional>
#include <string>

namespace rebalex {
namespace utils {

// Regular trading session in exchange-local wall time, expressed through a
// fixed UTC offset.
struct MarketSession {
    int open_minute = 9 * 60 + 30;
    int close_minute = 16 * 60;
    int utc_offset_minutes = -5 * 60;
    bool weekdays_only = true;
};

class TimeUtils {
public:
    // "2026-01-02T15:04:05Z" / "2026-01-02T15:04:05.250+00:00" / "2026-01-02 15:04:05"
    static std::optional<long long> parseIsoUtcMs(const std::string& text);
    static std::string formatIsoUtc(long long epoch_ms);

    static bool isMarketOpen(long long epoch_ms, const MarketSession& session);
};

} // namespace utils
} // namespace rebalex
