#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace rebalex {
namespace execution {

namespace {
std::string windowKey(const std::string& group, const std::string& key) {
    return key.empty() ? group : group + "|" + key;
}
}

RateLimiter::RateLimiter(std::shared_ptr<const IClock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    configs_.emplace("default", RateLimitConfig{"default", 30, 1000});
}

void RateLimiter::configureGroup(const std::string& group, int max_per_window, long long window_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[group] = RateLimitConfig{group, std::max(0, max_per_window), std::max(1LL, window_ms)};
}

const RateLimitConfig& RateLimiter::configFor(const std::string& group) const {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

bool RateLimiter::tryAcquire(const std::string& group, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const long long now = clock_->nowMs();
    const auto& config = configFor(group);
    auto& state = windows_[windowKey(group, key)];

    if (now < state.blocked_until_ms) {
        rejected_requests_++;
        return false;
    }

    resetWindowIfNeeded(config, state, now);

    if (state.current_count < config.max_per_window) {
        state.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

int RateLimiter::getRemainingRequests(const std::string& group, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const long long now = clock_->nowMs();
    const auto& config = configFor(group);
    auto& state = windows_[windowKey(group, key)];
    if (now < state.blocked_until_ms) {
        return 0;
    }
    resetWindowIfNeeded(config, state, now);
    return std::max(0, config.max_per_window - state.current_count);
}

void RateLimiter::blockUntil(const std::string& group, const std::string& key, long long until_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = windows_[windowKey(group, key)];
    state.blocked_until_ms = std::max(state.blocked_until_ms, until_ms);
    blocks_++;
    LOG_WARN("rate limiter: {} blocked until {}", windowKey(group, key), until_ms);
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.blocks = blocks_;
    return stats;
}

void RateLimiter::resetWindowIfNeeded(const RateLimitConfig& config, WindowState& state, long long now_ms) {
    if (state.window_start_ms == 0 || now_ms - state.window_start_ms >= config.window_ms) {
        state.window_start_ms = now_ms;
        state.current_count = 0;
    }
}

} // namespace execution
} // namespace rebalex
