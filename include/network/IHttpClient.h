#pragma once

#include <string>
#include <map>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace coinlens {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// 전송 계층 실패 (연결/타임아웃). HTTP 상태 코드는 여기에 해당하지 않음.
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, bool timed_out)
        : std::runtime_error(message), timed_out_(timed_out) {}

    bool timedOut() const { return timed_out_; }

private:
    bool timed_out_;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET 요청. url is absolute; throws TransportError when no response arrived.
    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {},
        const std::map<std::string, std::string>& headers = {}
    ) = 0;
};

} // namespace network
} // namespace coinlens
