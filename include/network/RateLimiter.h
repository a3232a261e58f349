#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace coinlens {
namespace network {

// Rate Limit 그룹별 설정 (고정 윈도우)
struct RateLimitConfig {
    std::string group_name;
    int max_requests;                       // 윈도우당 최대 요청 수
    std::chrono::milliseconds window;
    int current_count;
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req, std::chrono::milliseconds win)
        : group_name(name)
        , max_requests(max_req)
        , window(win)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// Client-side request budget per upstream (Thread-Safe)
// 서버 429는 FetchClient 백오프가 처리하고, 여기서는 윈도우를 건드리지 않음
class RateLimiter {
public:
    RateLimiter() = default;

    void configureGroup(const std::string& group, int max_requests, std::chrono::milliseconds window);

    // 요청 전 호출 - 필요시 다음 윈도우까지 대기 (Blocking)
    // 설정되지 않은 그룹은 제한 없음
    void acquire(const std::string& group);

private:
    std::map<std::string, RateLimitConfig> configs_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void resetWindowIfNeeded(RateLimitConfig& config);
};

} // namespace network
} // namespace coinlens
