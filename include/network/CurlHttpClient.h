#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <string>

namespace coinlens {
namespace network {

struct HttpClientOptions {
    long timeout_seconds = 10;
    std::string user_agent = "coinlens/1.0";
};

// libcurl GET client. Each request uses its own easy handle, so concurrent
// callers never serialize on a shared handle.
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(HttpClientOptions options = HttpClientOptions());
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {},
        const std::map<std::string, std::string>& headers = {}
    ) override;

private:
    HttpClientOptions options_;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    static std::string buildQueryString(CURL* curl, const std::map<std::string, std::string>& params);
};

} // namespace network
} // namespace coinlens
