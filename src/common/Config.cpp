#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace coinlens {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimCopy(s);
}

std::string readEnvVar(const char* name) {
#ifdef _WIN32
    char* value = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value, &len, name) != 0 || value == nullptr || len == 0) {
        if (value != nullptr) {
            free(value);
        }
        return "";
    }
    std::string out = trimCopy(value);
    free(value);
    return out;
#else
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
#endif
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    api_key_.clear();
    log_level_ = "info";
    log_dir_ = "logs";
    loaded_ = false;
    engine_config_ = engine::EngineConfig();
}

void Config::load(const std::string& path) {
    // 비밀 값은 설정 파일과 무관하게 항상 환경 변수에서
    api_key_ = readEnvVar("COINGECKO_API_KEY");
    engine_config_.aggregator_api_key = api_key_;

    try {
        std::filesystem::path config_path = utils::PathUtils::resolve(path);

        std::cout << "설정 파일 경로: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
            std::cout << "기본값을 사용합니다." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "경고: 설정 파일을 열 수 없습니다." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;

        if (j.contains("aggregator") && j["aggregator"].is_object()) {
            const std::string file_key = trimCopy(j["aggregator"].value("api_key", ""));
            if (!file_key.empty()) {
                std::cout << "경고: config api_key 값은 무시됩니다. 환경 변수(COINGECKO_API_KEY)를 사용하세요."
                          << std::endl;
            }
        }

        if (j.contains("fetch") && j["fetch"].is_object()) {
            applyFetch(j["fetch"]);
        }
        if (j.contains("exchange") && j["exchange"].is_object()) {
            applyExchange(j["exchange"]);
        }
        if (j.contains("aggregator") && j["aggregator"].is_object()) {
            applyAggregator(j["aggregator"]);
        }
        if (j.contains("analysis") && j["analysis"].is_object()) {
            applyAnalysis(j["analysis"]);
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            auto& l = j["logging"];
            log_level_ = toLowerCopy(l.value("level", "info"));
            log_dir_ = trimCopy(l.value("dir", "logs"));
        }

        loaded_ = true;
        std::cout << "설정 파일 로드 완료" << std::endl;
        std::cout << "Config Loaded: Window=" << engine_config_.window_days
                  << "d, Source=" << engine::toString(engine_config_.series_source)
                  << ", Retries=" << engine_config_.max_retries << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "설정 로드 오류: " << e.what() << std::endl;
    }
}

void Config::applyFetch(const nlohmann::json& f) {
    engine_config_.timeout_seconds = std::max(1L, f.value("timeout_seconds", 10L));
    engine_config_.max_retries = std::max(1, f.value("max_retries", 3));
    engine_config_.backoff_base_ms = std::max(0LL, f.value("backoff_base_ms", 1000LL));
    engine_config_.transient_retry_delay_ms = std::max(0LL, f.value("transient_retry_delay_ms", 1000LL));
    engine_config_.user_agent = f.value("user_agent", std::string("coinlens/1.0"));
}

void Config::applyExchange(const nlohmann::json& e) {
    engine_config_.exchange_base_url = e.value("base_url", engine_config_.exchange_base_url);
    engine_config_.exchange_requests_per_second = e.value("requests_per_second", 20);

    if (e.contains("quote_priority") && e["quote_priority"].is_array()) {
        std::vector<std::string> quotes;
        for (const auto& q : e["quote_priority"]) {
            if (!q.is_string()) continue;
            std::string quote = trimCopy(q.get<std::string>());
            std::transform(quote.begin(), quote.end(), quote.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (!quote.empty()) {
                quotes.push_back(quote);
            }
        }
        if (quotes.empty()) {
            std::cout << "경고: exchange.quote_priority 가 비어 있어 기본값(USDT, BTC)을 사용합니다." << std::endl;
        } else {
            engine_config_.quote_priority = quotes;
        }
    }
}

void Config::applyAggregator(const nlohmann::json& a) {
    engine_config_.aggregator_base_url = a.value("base_url", engine_config_.aggregator_base_url);
    engine_config_.vs_currency = toLowerCopy(a.value("vs_currency", std::string("usd")));
    engine_config_.aggregator_requests_per_minute = a.value("requests_per_minute", 30);
}

void Config::applyAnalysis(const nlohmann::json& a) {
    engine_config_.window_days = a.value("window_days", 30);
    if (engine_config_.window_days < 3) {
        // 시간봉 50개 미만이면 모든 분석이 INSUFFICIENT_DATA
        std::cout << "경고: window_days=" << engine_config_.window_days
                  << " 은 최소 샘플 수를 채울 수 없어 3일로 조정합니다." << std::endl;
        engine_config_.window_days = 3;
    }

    const std::string mode_str = toLowerCopy(a.value("resolution_mode", std::string("coin_catalog")));
    auto mode = market::parseResolutionMode(mode_str);
    if (mode) {
        engine_config_.resolution_mode = *mode;
    } else {
        std::cout << "경고: 알 수 없는 resolution_mode '" << mode_str << "', coin_catalog 사용" << std::endl;
    }

    const std::string source_str = toLowerCopy(a.value("series_source", std::string("exchange")));
    if (source_str == "aggregator") {
        engine_config_.series_source = engine::SeriesSourceKind::AGGREGATOR;
    } else if (source_str == "exchange") {
        engine_config_.series_source = engine::SeriesSourceKind::EXCHANGE;
    } else {
        std::cout << "경고: 알 수 없는 series_source '" << source_str << "', exchange 사용" << std::endl;
        engine_config_.series_source = engine::SeriesSourceKind::EXCHANGE;
    }

    // 거래쌍 id 로는 애그리게이터 차트를 조회할 수 없음
    if (engine_config_.resolution_mode == market::ResolutionMode::EXCHANGE_PAIR &&
        engine_config_.series_source == engine::SeriesSourceKind::AGGREGATOR) {
        std::cout << "경고: exchange_pair 모드는 aggregator 시계열과 함께 쓸 수 없어 exchange 로 변경합니다." << std::endl;
        engine_config_.series_source = engine::SeriesSourceKind::EXCHANGE;
    }

    const int max_suggestions = a.value("max_suggestions", 5);
    engine_config_.max_suggestions = static_cast<std::size_t>(std::max(1, max_suggestions));

    if (a.contains("reference") && a["reference"].is_object()) {
        auto& r = a["reference"];
        engine_config_.reference_id = r.value("id", engine_config_.reference_id);
        engine_config_.reference_code = r.value("code", engine_config_.reference_code);
        engine_config_.reference_name = r.value("name", engine_config_.reference_name);
    }
}

} // namespace coinlens
