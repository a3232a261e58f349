#include "network/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace coinlens {
namespace network {

void RateLimiter::configureGroup(const std::string& group, int max_requests, std::chrono::milliseconds window) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_.erase(group);
    configs_.emplace(group, RateLimitConfig(group, std::max(1, max_requests), window));
    LOG_INFO("RateLimiter group '{}': {} req / {} ms", group, max_requests, window.count());
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        auto it = configs_.find(group);
        if (it == configs_.end()) {
            return;
        }
        auto& config = it->second;

        resetWindowIfNeeded(config);

        if (config.current_count < config.max_requests) {
            config.current_count++;
            return;
        }

        // 다음 윈도우 시작 지점까지 대기
        auto wake_time = config.window_start + config.window + std::chrono::milliseconds(1);
        LOG_DEBUG("RateLimiter '{}' budget spent, waiting for next window", group);
        cv_.wait_until(lock, wake_time);
    }
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    if (now - config.window_start >= config.window) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace network
} // namespace coinlens
