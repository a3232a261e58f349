#include "network/FetchClient.h"
#include "common/Logger.h"
#include <algorithm>
#include <thread>

namespace coinlens {
namespace network {

const char* toString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::RETRIES_EXHAUSTED: return "RETRIES_EXHAUSTED";
        case FetchErrorKind::HTTP_STATUS: return "HTTP_STATUS";
        case FetchErrorKind::INVALID_PAYLOAD: return "INVALID_PAYLOAD";
    }
    return "RETRIES_EXHAUSTED";
}

FetchClient::FetchClient(
    std::shared_ptr<IHttpClient> http,
    FetchPolicy policy,
    std::shared_ptr<RateLimiter> rate_limiter,
    std::string rate_group
)
    : http_(std::move(http))
    , policy_(policy)
    , rate_limiter_(std::move(rate_limiter))
    , rate_group_(std::move(rate_group))
    , sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
{
    policy_.max_retries = std::max(1, policy_.max_retries);
}

FetchResult FetchClient::fetch(
    const std::string& url,
    const std::map<std::string, std::string>& query_params,
    const std::map<std::string, std::string>& headers
) {
    FetchResult result;
    FetchError last_failure;
    last_failure.kind = FetchErrorKind::RETRIES_EXHAUSTED;

    for (int attempt = 0; attempt < policy_.max_retries; ++attempt) {
        const bool last_attempt = (attempt == policy_.max_retries - 1);
        if (rate_limiter_) {
            rate_limiter_->acquire(rate_group_);
        }
        result.attempts = attempt + 1;

        HttpResponse response;
        try {
            response = http_->get(url, query_params, headers);
        } catch (const TransportError& e) {
            LOG_ERROR("API request failed (attempt {}): {} - {}", attempt + 1, url, e.what());
            last_failure.rate_limited = false;
            last_failure.timed_out = e.timedOut();
            last_failure.status_code = 0;
            last_failure.message = std::string(e.timedOut() ? "timeout: " : "transport: ") + e.what();
            if (!last_attempt) {
                sleeper_(policy_.transient_retry_delay);
            }
            continue;
        }

        if (response.isRateLimited()) {
            const auto wait_time = policy_.backoff_base * (1LL << attempt);
            LOG_WARN("Rate limit exceeded (attempt {}): {}. Waiting {} ms.",
                     attempt + 1, url, wait_time.count());
            last_failure.rate_limited = true;
            last_failure.timed_out = false;
            last_failure.status_code = response.status_code;
            last_failure.message = "HTTP 429 Too Many Requests";
            if (!last_attempt) {
                sleeper_(wait_time);
            }
            continue;
        }

        if (!response.isSuccess()) {
            LOG_ERROR("API request failed: {} - HTTP {} {}",
                      url, response.status_code, truncateForLog(response.body));
            FetchError error;
            error.kind = FetchErrorKind::HTTP_STATUS;
            error.status_code = response.status_code;
            error.message = "HTTP " + std::to_string(response.status_code);
            result.error = error;
            return result;
        }

        try {
            result.payload = response.json();
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("Invalid JSON payload from {}: {}", url, e.what());
            FetchError error;
            error.kind = FetchErrorKind::INVALID_PAYLOAD;
            error.status_code = response.status_code;
            error.message = e.what();
            result.error = error;
            return result;
        }
        return result;
    }

    LOG_ERROR("Max retries exceeded ({}): {}", policy_.max_retries, url);
    result.error = last_failure;
    return result;
}

std::string FetchClient::truncateForLog(const std::string& text) {
    constexpr size_t kMaxLen = 300;
    if (text.size() <= kMaxLen) {
        return text;
    }
    return text.substr(0, kMaxLen) + "...";
}

} // namespace network
} // namespace coinlens
