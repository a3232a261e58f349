#include "network/CurlHttpClient.h"
#include "common/Logger.h"
#include <memory>
#include <sstream>

namespace coinlens {
namespace network {

namespace {
struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
}

CurlHttpClient::CurlHttpClient(HttpClientOptions options)
    : options_(std::move(options))
{
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& query_params,
    const std::map<std::string, std::string>& headers
) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransportError("Failed to create CURL handle", false);
    }

    std::string full_url = url;
    if (!query_params.empty()) {
        full_url += "?" + buildQueryString(curl.get(), query_params);
    }

    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, full_url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());

    curl_slist* raw_list = curl_slist_append(nullptr, "Accept: application/json");
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        raw_list = curl_slist_append(raw_list, header_line.c_str());
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_list);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

    LOG_DEBUG("GET {}", full_url);
    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        throw TransportError(
            "CURL error: " + std::string(curl_easy_strerror(res)),
            res == CURLE_OPERATION_TIMEDOUT
        );
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);

    return response;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

std::string CurlHttpClient::buildQueryString(CURL* curl, const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        oss << key << "=" << (escaped ? escaped : value.c_str());
        if (escaped) curl_free(escaped);
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace coinlens
