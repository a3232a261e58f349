#include "common/Config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
void setEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

std::filesystem::path writeConfig(const std::string& file_name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / file_name;
    std::ofstream out(path);
    out << body;
    return path;
}
}

int main() {
    using namespace coinlens;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // missing file: defaults
    {
        config.reset();
        setEnv("COINGECKO_API_KEY", "");
        config.load((std::filesystem::temp_directory_path() / "coinlens_missing_config.json").string());
        assert(!config.isLoaded());

        auto settings = config.getEngineConfig();
        assert(settings.window_days == 30);
        assert(settings.max_retries == 3);
        assert(settings.timeout_seconds == 10);
        assert(settings.backoff_base_ms == 1000);
        assert(settings.resolution_mode == market::ResolutionMode::COIN_CATALOG);
        assert(settings.series_source == engine::SeriesSourceKind::EXCHANGE);
        assert(settings.quote_priority.size() == 2 && settings.quote_priority[0] == "USDT");
        assert(settings.max_suggestions == 5);
        assert(settings.reference_id == "bitcoin");
        assert(config.getApiKey().empty());
        assert(config.getLogLevel() == "info");
    }

    // full file; the key in the file is ignored in favour of the environment
    {
        config.reset();
        setEnv("COINGECKO_API_KEY", "  env-demo-key ");
        auto path = writeConfig("coinlens_test_config.json", R"({
            "fetch": {"timeout_seconds": 5, "max_retries": 4, "backoff_base_ms": 250, "transient_retry_delay_ms": 100},
            "exchange": {"base_url": "https://exchange.test", "quote_priority": ["btc", " usdt "], "requests_per_second": 5},
            "aggregator": {"base_url": "https://aggregator.test", "vs_currency": "EUR", "requests_per_minute": 10,
                           "api_key": "file-key"},
            "analysis": {"window_days": 14, "resolution_mode": "exchange_pair", "series_source": "exchange",
                         "max_suggestions": 3, "reference": {"id": "ethereum", "code": "ETH", "name": "Ethereum"}},
            "logging": {"level": "DEBUG", "dir": "/tmp/coinlens-logs"}
        })");
        config.load(path.string());
        assert(config.isLoaded());

        auto settings = config.getEngineConfig();
        assert(settings.timeout_seconds == 5);
        assert(settings.max_retries == 4);
        assert(settings.backoff_base_ms == 250);
        assert(settings.transient_retry_delay_ms == 100);
        assert(settings.exchange_base_url == "https://exchange.test");
        assert(settings.quote_priority.size() == 2);
        assert(settings.quote_priority[0] == "BTC" && settings.quote_priority[1] == "USDT");
        assert(settings.exchange_requests_per_second == 5);
        assert(settings.aggregator_base_url == "https://aggregator.test");
        assert(settings.vs_currency == "eur");
        assert(settings.aggregator_requests_per_minute == 10);
        assert(settings.window_days == 14);
        assert(settings.resolution_mode == market::ResolutionMode::EXCHANGE_PAIR);
        assert(settings.max_suggestions == 3);
        assert(settings.reference_code == "ETH");
        assert(config.getApiKey() == "env-demo-key");
        assert(settings.aggregator_api_key == "env-demo-key");
        assert(config.getLogLevel() == "debug");
        assert(config.getLogDir() == "/tmp/coinlens-logs");

        std::filesystem::remove(path);
    }

    // invalid values fall back or are corrected
    {
        config.reset();
        auto path = writeConfig("coinlens_test_config_invalid.json", R"({
            "fetch": {"max_retries": 0},
            "analysis": {"window_days": 1, "resolution_mode": "fuzzy", "series_source": "aggregator",
                         "max_suggestions": -2}
        })");
        config.load(path.string());

        auto settings = config.getEngineConfig();
        assert(settings.max_retries == 1);
        assert(settings.window_days == 3);
        assert(settings.resolution_mode == market::ResolutionMode::COIN_CATALOG);
        assert(settings.series_source == engine::SeriesSourceKind::AGGREGATOR);
        assert(settings.max_suggestions == 1);

        std::filesystem::remove(path);
    }

    // pair ids cannot address the aggregator chart
    {
        config.reset();
        auto path = writeConfig("coinlens_test_config_mode.json", R"({
            "analysis": {"resolution_mode": "exchange_pair", "series_source": "aggregator"}
        })");
        config.load(path.string());
        assert(config.getEngineConfig().series_source == engine::SeriesSourceKind::EXCHANGE);
        std::filesystem::remove(path);
    }

    // malformed JSON keeps defaults
    {
        config.reset();
        auto path = writeConfig("coinlens_test_config_broken.json", "{ \"analysis\": ");
        config.load(path.string());
        assert(!config.isLoaded());
        assert(config.getEngineConfig().window_days == 30);
        std::filesystem::remove(path);
    }

    // command-line override
    {
        config.setWindowDays(7);
        assert(config.getEngineConfig().window_days == 7);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
