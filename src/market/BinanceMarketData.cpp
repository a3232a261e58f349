#include "market/BinanceMarketData.h"
#include "market/SeriesFetcher.h"
#include "market/SymbolResolver.h"
#include "common/Logger.h"

#include <algorithm>

namespace coinlens {
namespace market {

BinanceExchangeInfo::BinanceExchangeInfo(std::shared_ptr<network::FetchClient> fetch, BinanceEndpoints endpoints)
    : fetch_(std::move(fetch))
    , endpoints_(std::move(endpoints))
{
}

std::optional<std::set<std::string>> BinanceExchangeInfo::fetchCatalog() {
    auto result = fetch_->fetch(endpoints_.base_url + "/api/v3/exchangeInfo");
    if (!result.ok()) {
        LOG_ERROR("Error getting exchange info: {}", result.error->message);
        return std::nullopt;
    }

    const auto& payload = result.payload;
    if (!payload.is_object() || !payload.contains("symbols") || !payload["symbols"].is_array()) {
        LOG_ERROR("Error getting exchange info: 'symbols' array missing");
        return std::nullopt;
    }

    std::set<std::string> pairs;
    for (const auto& entry : payload["symbols"]) {
        if (entry.is_object() && entry.contains("symbol") && entry["symbol"].is_string()) {
            pairs.insert(entry["symbol"].get<std::string>());
        }
    }
    return pairs;
}

BinanceKlineSource::BinanceKlineSource(
    std::shared_ptr<network::FetchClient> fetch,
    std::shared_ptr<CatalogCache> catalog,
    BinanceEndpoints endpoints
)
    : fetch_(std::move(fetch))
    , catalog_(std::move(catalog))
    , endpoints_(std::move(endpoints))
{
}

InstrumentMatch BinanceKlineSource::matchInstrument(const ResolvedSymbol& symbol) {
    InstrumentMatch match;
    const auto catalog = catalog_->getCatalog();
    match.catalog_available = !catalog_->loadFailed();

    // exchange-pair 모드에서 이미 거래쌍으로 해석된 경우
    if (catalog->count(symbol.id) > 0) {
        match.instrument = symbol.id;
        match.listed = true;
        return match;
    }

    if (auto pair = SymbolResolver::matchExchangePair(symbol.code, *catalog, endpoints_.quote_priority)) {
        match.instrument = *pair;
        match.listed = true;
    }
    return match;
}

network::FetchResult BinanceKlineSource::requestSeries(const std::string& instrument, int window_days) {
    const int limit = std::clamp(window_days * 24, 1, kMaxLimit);

    std::map<std::string, std::string> params;
    params["symbol"] = instrument;
    params["interval"] = "1h";
    params["limit"] = std::to_string(limit);

    return fetch_->fetch(endpoints_.base_url + "/api/v3/klines", params);
}

std::vector<OHLCVSample> BinanceKlineSource::parseSeries(const nlohmann::json& payload, std::size_t& rejected) const {
    std::vector<OHLCVSample> samples;
    rejected = 0;
    if (!payload.is_array()) {
        LOG_ERROR("Unexpected klines payload (not an array)");
        return samples;
    }
    samples.reserve(payload.size());

    for (const auto& row : payload) {
        if (!row.is_array() || row.size() < 11) {
            rejected++;
            continue;
        }

        OHLCVSample s;
        const bool ok =
            coerceInteger(row[0], s.open_time) &&
            coerceNumber(row[1], s.open) &&
            coerceNumber(row[2], s.high) &&
            coerceNumber(row[3], s.low) &&
            coerceNumber(row[4], s.close) &&
            coerceNumber(row[5], s.volume) &&
            coerceInteger(row[6], s.close_time) &&
            coerceNumber(row[7], s.quote_volume) &&
            coerceInteger(row[8], s.trade_count) &&
            coerceNumber(row[9], s.taker_buy_base) &&
            coerceNumber(row[10], s.taker_buy_quote);

        if (!ok || !isWellFormed(s)) {
            rejected++;
            continue;
        }
        samples.push_back(s);
    }
    return samples;
}

} // namespace market
} // namespace coinlens
