#include "engine/AnalysisEngine.h"
#include "common/Logger.h"
#include "market/BinanceMarketData.h"
#include "market/CatalogCache.h"
#include "network/CurlHttpClient.h"
#include "network/FetchClient.h"
#include "network/RateLimiter.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace coinlens {
namespace engine {

namespace {
bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}
}

const char* toString(SeriesSourceKind kind) {
    switch (kind) {
        case SeriesSourceKind::EXCHANGE: return "exchange";
        case SeriesSourceKind::AGGREGATOR: return "aggregator";
    }
    return "unknown";
}

const char* toString(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::OK: return "OK";
        case AnalysisStatus::NOT_FOUND: return "NOT_FOUND";
        case AnalysisStatus::AMBIGUOUS: return "AMBIGUOUS";
        case AnalysisStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case AnalysisStatus::NETWORK_FAILURE: return "NETWORK_FAILURE";
        case AnalysisStatus::COMPUTATION_ERROR: return "COMPUTATION_ERROR";
    }
    return "UNKNOWN";
}

AnalysisEngine::AnalysisEngine(
    const EngineConfig& config,
    std::shared_ptr<market::SymbolResolver> resolver,
    std::shared_ptr<market::SeriesFetcher> series,
    std::shared_ptr<market::CoinGeckoDirectory> listings,
    analytics::IndicatorEngine indicators
)
    : config_(config)
    , resolver_(std::move(resolver))
    , series_(std::move(series))
    , listings_(std::move(listings))
    , indicators_(std::move(indicators))
{
    LOG_INFO("AnalysisEngine 초기화");
    LOG_INFO("  시계열 소스: {} ({}), 기간: {}일", toString(config_.series_source),
             series_->sourceName(), config_.window_days);
    LOG_INFO("  기준 자산: {} ({})", config_.reference_name, config_.reference_code);
}

std::unique_ptr<AnalysisEngine> AnalysisEngine::create(const EngineConfig& config) {
    network::HttpClientOptions http_options;
    http_options.timeout_seconds = config.timeout_seconds;
    http_options.user_agent = config.user_agent;
    auto http = std::make_shared<network::CurlHttpClient>(http_options);

    auto limiter = std::make_shared<network::RateLimiter>();
    limiter->configureGroup("exchange", config.exchange_requests_per_second, std::chrono::milliseconds(1000));
    limiter->configureGroup("aggregator", config.aggregator_requests_per_minute, std::chrono::milliseconds(60000));

    network::FetchPolicy policy;
    policy.max_retries = config.max_retries;
    policy.backoff_base = std::chrono::milliseconds(config.backoff_base_ms);
    policy.transient_retry_delay = std::chrono::milliseconds(config.transient_retry_delay_ms);

    auto exchange_fetch = std::make_shared<network::FetchClient>(http, policy, limiter, "exchange");
    auto aggregator_fetch = std::make_shared<network::FetchClient>(http, policy, limiter, "aggregator");

    market::BinanceEndpoints binance;
    binance.base_url = config.exchange_base_url;
    binance.quote_priority = config.quote_priority;

    market::CoinGeckoEndpoints coingecko;
    coingecko.base_url = config.aggregator_base_url;
    coingecko.vs_currency = config.vs_currency;
    coingecko.api_key = config.aggregator_api_key;

    auto catalog = std::make_shared<market::CatalogCache>(
        std::make_shared<market::BinanceExchangeInfo>(exchange_fetch, binance));
    auto directory = std::make_shared<market::CoinGeckoDirectory>(aggregator_fetch, coingecko);

    market::ResolverOptions resolver_options;
    resolver_options.mode = config.resolution_mode;
    resolver_options.quote_priority = config.quote_priority;
    resolver_options.max_suggestions = config.max_suggestions;
    auto resolver = std::make_shared<market::SymbolResolver>(catalog, directory, resolver_options);

    std::shared_ptr<market::ISeriesSource> source;
    if (config.series_source == SeriesSourceKind::AGGREGATOR) {
        source = std::make_shared<market::CoinGeckoChartSource>(aggregator_fetch, coingecko);
    } else {
        source = std::make_shared<market::BinanceKlineSource>(exchange_fetch, catalog, binance);
    }

    return std::make_unique<AnalysisEngine>(
        config, resolver, std::make_shared<market::SeriesFetcher>(source), directory);
}

AnalysisReport AnalysisEngine::analyze(const std::string& user_input) {
    AnalysisReport report;
    report.query = user_input;
    report.source = series_->sourceName();

    auto resolution = resolver_->resolve(user_input);
    if (resolution.kind == market::ResolutionKind::AMBIGUOUS) {
        report.status = AnalysisStatus::AMBIGUOUS;
        report.suggestions = resolution.suggestions;
        report.detail = "multiple candidates for '" + user_input + "'";
        return report;
    }
    if (resolution.kind == market::ResolutionKind::UNAVAILABLE) {
        report.status = AnalysisStatus::NETWORK_FAILURE;
        report.detail = "symbol lookup upstream unavailable";
        return report;
    }
    if (!resolution.resolved() || !resolution.symbol) {
        report.status = AnalysisStatus::NOT_FOUND;
        report.detail = "no symbol matches '" + user_input + "'";
        return report;
    }

    report.symbol = resolution.symbol;
    analyzeResolved(*resolution.symbol, report);

    if (report.ok()) {
        Logger::getInstance().logAnalysis(resolution.symbol->code, report.snapshot);
        attachReference(report);
        LOG_INFO("{} 분석 완료: price={} rsi={} samples={}",
                 resolution.symbol->code, report.snapshot.price, report.snapshot.rsi, report.sample_count);
    } else {
        LOG_WARN("{} 분석 실패: {} ({})", user_input, toString(report.status), report.detail);
    }
    return report;
}

std::future<AnalysisReport> AnalysisEngine::analyzeAsync(const std::string& user_input) {
    return std::async(std::launch::async, [this, user_input]() {
        return analyze(user_input);
    });
}

void AnalysisEngine::analyzeResolved(const ResolvedSymbol& symbol, AnalysisReport& report) {
    auto batch = series_->fetchSeries(symbol, config_.window_days);
    report.instrument = batch.instrument;

    if (!batch.listed) {
        if (batch.catalog_available) {
            report.status = AnalysisStatus::NOT_FOUND;
            report.detail = symbol.code + " is not listed on " + series_->sourceName();
        } else {
            report.status = AnalysisStatus::NETWORK_FAILURE;
            report.detail = "instrument catalog unavailable";
        }
        return;
    }

    if (batch.upstreamFailed()) {
        const auto& error = *batch.error;
        if (error.kind == network::FetchErrorKind::HTTP_STATUS && error.status_code == 404) {
            report.status = AnalysisStatus::NOT_FOUND;
        } else {
            report.status = AnalysisStatus::NETWORK_FAILURE;
        }
        report.detail = std::string(network::toString(error.kind)) + ": " + error.message;
        return;
    }

    auto outcome = indicators_.compute(batch.samples);
    report.sample_count = outcome.valid_samples;
    switch (outcome.status) {
        case analytics::IndicatorStatus::OK:
            report.status = AnalysisStatus::OK;
            report.snapshot = outcome.snapshot;
            break;
        case analytics::IndicatorStatus::INSUFFICIENT_DATA:
            report.status = AnalysisStatus::INSUFFICIENT_DATA;
            report.detail = outcome.detail;
            break;
        case analytics::IndicatorStatus::COMPUTATION_ERROR:
            report.status = AnalysisStatus::COMPUTATION_ERROR;
            report.detail = outcome.detail;
            break;
    }
}

bool AnalysisEngine::isReference(const ResolvedSymbol& symbol) const {
    return symbol.id == config_.reference_id || equalsIgnoreCase(symbol.code, config_.reference_code);
}

std::optional<IndicatorSnapshot> AnalysisEngine::referenceSnapshot() {
    ResolvedSymbol reference{config_.reference_id, config_.reference_code, config_.reference_name};

    AnalysisReport scratch;
    analyzeResolved(reference, scratch);
    if (!scratch.ok()) {
        LOG_WARN("기준 자산 {} 분석 실패: {}", reference.code, toString(scratch.status));
        return std::nullopt;
    }
    return scratch.snapshot;
}

void AnalysisEngine::attachReference(AnalysisReport& report) {
    if (report.symbol && isReference(*report.symbol)) {
        report.reference = report.snapshot;
        report.reference_available = true;
        return;
    }

    auto reference = referenceSnapshot();
    if (reference) {
        report.reference = *reference;
        report.reference_available = true;
    } else {
        report.reference = IndicatorSnapshot();
        report.reference_available = false;
    }
}

std::vector<CoinListing> AnalysisEngine::topCoins(int limit) {
    if (!listings_) {
        return {};
    }
    return listings_->topCoins(limit);
}

std::vector<CoinListing> AnalysisEngine::searchCoins(const std::string& query, std::size_t limit) {
    if (!listings_) {
        return {};
    }
    return listings_->searchCoins(query, limit);
}

nlohmann::json toJson(const AnalysisReport& report) {
    nlohmann::json j;
    j["status"] = toString(report.status);
    j["query"] = report.query;
    j["source"] = report.source;

    if (report.symbol) {
        j["symbol"] = {
            {"id", report.symbol->id},
            {"code", report.symbol->code},
            {"name", report.symbol->name}
        };
    }
    if (!report.instrument.empty()) {
        j["instrument"] = report.instrument;
    }

    if (report.ok()) {
        j["snapshot"] = analytics::snapshotToJson(report.snapshot);
        j["reference"] = analytics::snapshotToJson(report.reference);
        j["reference_available"] = report.reference_available;
        j["sample_count"] = report.sample_count;
    }

    if (!report.suggestions.empty()) {
        nlohmann::json suggestions = nlohmann::json::array();
        for (const auto& s : report.suggestions) {
            suggestions.push_back({{"id", s.id}, {"code", s.code}, {"name", s.name}});
        }
        j["suggestions"] = suggestions;
    }
    if (!report.detail.empty()) {
        j["detail"] = report.detail;
    }
    return j;
}

} // namespace engine
} // namespace coinlens
