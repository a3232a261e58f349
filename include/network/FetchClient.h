#pragma once

#include "network/IHttpClient.h"
#include "network/RateLimiter.h"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace coinlens {
namespace network {

enum class FetchErrorKind {
    RETRIES_EXHAUSTED,  // every attempt hit 429 or a transport failure
    HTTP_STATUS,        // non-2xx other than 429, not retried
    INVALID_PAYLOAD     // 2xx whose body is not JSON
};

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::RETRIES_EXHAUSTED;
    int status_code = 0;
    bool rate_limited = false;  // last failed attempt was a 429
    bool timed_out = false;     // last failed attempt hit the request timeout
    std::string message;
};

struct FetchResult {
    nlohmann::json payload;
    std::optional<FetchError> error;
    int attempts = 0;

    bool ok() const { return !error.has_value(); }
};

struct FetchPolicy {
    int max_retries = 3;                                    // total attempts
    std::chrono::milliseconds backoff_base{1000};           // 429: base * 2^attempt
    std::chrono::milliseconds transient_retry_delay{1000};  // transport error
};

const char* toString(FetchErrorKind kind);

// 재시도/백오프 정책을 적용한 JSON GET
class FetchClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    FetchClient(
        std::shared_ptr<IHttpClient> http,
        FetchPolicy policy = FetchPolicy(),
        std::shared_ptr<RateLimiter> rate_limiter = nullptr,
        std::string rate_group = "default"
    );

    FetchResult fetch(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {},
        const std::map<std::string, std::string>& headers = {}
    );

    // Tests replace the sleeper to observe backoff without waiting.
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    const FetchPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<IHttpClient> http_;
    FetchPolicy policy_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::string rate_group_;
    Sleeper sleeper_;

    static std::string truncateForLog(const std::string& text);
};

} // namespace network
} // namespace coinlens
