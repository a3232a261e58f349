#pragma once

#include <memory>
#include <string>
#include <vector>

#include "market/CatalogCache.h"
#include "market/IMarketDataSource.h"
#include "network/FetchClient.h"

namespace coinlens {
namespace market {

struct BinanceEndpoints {
    std::string base_url = "https://api.binance.com";
    std::vector<std::string> quote_priority{"USDT", "BTC"};
};

// GET /api/v3/exchangeInfo -> {"symbols": [{"symbol": "BTCUSDT", ...}, ...]}
class BinanceExchangeInfo : public ICatalogSource {
public:
    BinanceExchangeInfo(std::shared_ptr<network::FetchClient> fetch, BinanceEndpoints endpoints = BinanceEndpoints());

    std::string name() const override { return "binance"; }
    std::optional<std::set<std::string>> fetchCatalog() override;

private:
    std::shared_ptr<network::FetchClient> fetch_;
    BinanceEndpoints endpoints_;
};

// GET /api/v3/klines?symbol=..&interval=1h&limit=..
// Row: [open_time, open, high, low, close, volume, close_time,
//       quote_volume, trade_count, taker_buy_base, taker_buy_quote, ignore]
class BinanceKlineSource : public ISeriesSource {
public:
    static constexpr int kMaxLimit = 1000;

    BinanceKlineSource(
        std::shared_ptr<network::FetchClient> fetch,
        std::shared_ptr<CatalogCache> catalog,
        BinanceEndpoints endpoints = BinanceEndpoints()
    );

    std::string name() const override { return "binance"; }

    InstrumentMatch matchInstrument(const ResolvedSymbol& symbol) override;
    network::FetchResult requestSeries(const std::string& instrument, int window_days) override;
    std::vector<OHLCVSample> parseSeries(const nlohmann::json& payload, std::size_t& rejected) const override;

private:
    std::shared_ptr<network::FetchClient> fetch_;
    std::shared_ptr<CatalogCache> catalog_;
    BinanceEndpoints endpoints_;
};

} // namespace market
} // namespace coinlens
