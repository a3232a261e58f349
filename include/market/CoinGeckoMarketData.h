#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "market/IMarketDataSource.h"
#include "network/FetchClient.h"

namespace coinlens {
namespace market {

struct CoinGeckoEndpoints {
    std::string base_url = "https://api.coingecko.com/api/v3";
    std::string vs_currency = "usd";
    std::string api_key;    // optional demo key, from the environment only
};

// 코인 카탈로그 (id 조회 / 검색 / 시가총액 순위)
class CoinGeckoDirectory : public ICoinDirectory {
public:
    CoinGeckoDirectory(std::shared_ptr<network::FetchClient> fetch, CoinGeckoEndpoints endpoints = CoinGeckoEndpoints());

    std::string name() const override { return "coingecko"; }

    // GET /coins/{id}
    std::optional<ResolvedSymbol> lookup(const std::string& id) override;

    // GET /search?query=..  -> coins[] in relevance order
    std::optional<std::vector<CandidateSuggestion>> search(const std::string& query) override;

    // Search rows whose code or name contains the query (case-insensitive), with rank.
    std::vector<CoinListing> searchCoins(const std::string& query, std::size_t limit = 10);

    // GET /coins/markets ordered by market cap
    std::vector<CoinListing> topCoins(int limit = 20);

private:
    std::shared_ptr<network::FetchClient> fetch_;
    CoinGeckoEndpoints endpoints_;

    std::map<std::string, std::string> headers() const;
    std::optional<nlohmann::json> searchPayload(const std::string& query);
};

// GET /coins/{id}/market_chart?vs_currency=usd&days=N
// Hourly point prices for 2..90 days; used as a coarser OHLCV proxy
// (open = high = low = close = point price, volume = reported 24h volume).
class CoinGeckoChartSource : public ISeriesSource {
public:
    static constexpr long long kBucketMs = 3600LL * 1000LL;

    CoinGeckoChartSource(std::shared_ptr<network::FetchClient> fetch, CoinGeckoEndpoints endpoints = CoinGeckoEndpoints());

    std::string name() const override { return "coingecko"; }

    InstrumentMatch matchInstrument(const ResolvedSymbol& symbol) override;
    network::FetchResult requestSeries(const std::string& instrument, int window_days) override;
    std::vector<OHLCVSample> parseSeries(const nlohmann::json& payload, std::size_t& rejected) const override;

private:
    std::shared_ptr<network::FetchClient> fetch_;
    CoinGeckoEndpoints endpoints_;
};

} // namespace market
} // namespace coinlens
