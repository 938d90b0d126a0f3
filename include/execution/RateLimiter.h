#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "common/Clock.h"

namespace rebalex {
namespace execution {

// Per-group window configuration
struct RateLimitConfig {
    std::string group_name;
    int max_per_window = 1;
    long long window_ms = 1000;
};

// Fixed-window limiter keyed by (group, key). All time comes from the
// injected clock, so windows can be tested without sleeping.
class RateLimiter {
public:
    explicit RateLimiter(std::shared_ptr<const IClock> clock);

    void configureGroup(const std::string& group, int max_per_window, long long window_ms);

    // Non-blocking: true when a slot was taken.
    bool tryAcquire(const std::string& group, const std::string& key = "");

    int getRemainingRequests(const std::string& group, const std::string& key = "");

    // Rejects every acquire for (group, key) until until_ms.
    void blockUntil(const std::string& group, const std::string& key, long long until_ms);

    struct Stats {
        int total_requests = 0;
        int rejected_requests = 0;
        int blocks = 0;
    };
    Stats getStats() const;

private:
    struct WindowState {
        int current_count = 0;
        long long window_start_ms = 0;
        long long blocked_until_ms = 0;
    };

    const RateLimitConfig& configFor(const std::string& group) const;
    void resetWindowIfNeeded(const RateLimitConfig& config, WindowState& state, long long now_ms);

    std::shared_ptr<const IClock> clock_;
    std::map<std::string, RateLimitConfig> configs_;
    std::map<std::string, WindowState> windows_;
    mutable std::mutex mutex_;

    int total_requests_ = 0;
    int rejected_requests_ = 0;
    int blocks_ = 0;
};

} // namespace execution
} // namespace rebalex
