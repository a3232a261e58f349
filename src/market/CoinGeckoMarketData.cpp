#include "market/CoinGeckoMarketData.h"
#include "market/SeriesFetcher.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>

namespace coinlens {
namespace market {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool hasStrings(const nlohmann::json& entry, std::initializer_list<const char*> keys) {
    if (!entry.is_object()) return false;
    for (const char* key : keys) {
        if (!entry.contains(key) || !entry[key].is_string()) return false;
    }
    return true;
}

std::optional<int> readRank(const nlohmann::json& entry) {
    if (entry.contains("market_cap_rank") && entry["market_cap_rank"].is_number_integer()) {
        return entry["market_cap_rank"].get<int>();
    }
    return std::nullopt;
}
} // namespace

// ========== CoinGeckoDirectory ==========

CoinGeckoDirectory::CoinGeckoDirectory(std::shared_ptr<network::FetchClient> fetch, CoinGeckoEndpoints endpoints)
    : fetch_(std::move(fetch))
    , endpoints_(std::move(endpoints))
{
}

std::map<std::string, std::string> CoinGeckoDirectory::headers() const {
    std::map<std::string, std::string> h;
    if (!endpoints_.api_key.empty()) {
        h["x-cg-demo-api-key"] = endpoints_.api_key;
    }
    return h;
}

std::optional<ResolvedSymbol> CoinGeckoDirectory::lookup(const std::string& id) {
    std::map<std::string, std::string> params;
    params["localization"] = "false";
    params["tickers"] = "false";
    params["market_data"] = "false";
    params["community_data"] = "false";
    params["developer_data"] = "false";

    auto result = fetch_->fetch(endpoints_.base_url + "/coins/" + id, params, headers());
    if (!result.ok()) {
        // 404 = not a valid coin id, expected for symbols like "btc"
        LOG_DEBUG("Coin lookup '{}' failed: {}", id, result.error->message);
        return std::nullopt;
    }

    const auto& data = result.payload;
    if (!hasStrings(data, {"id", "symbol", "name"})) {
        return std::nullopt;
    }
    return ResolvedSymbol{
        data["id"].get<std::string>(),
        toUpperCopy(data["symbol"].get<std::string>()),
        data["name"].get<std::string>()
    };
}

std::optional<nlohmann::json> CoinGeckoDirectory::searchPayload(const std::string& query) {
    std::map<std::string, std::string> params;
    params["query"] = query;

    auto result = fetch_->fetch(endpoints_.base_url + "/search", params, headers());
    if (!result.ok()) {
        LOG_ERROR("Error searching for coin {}: {}", query, result.error->message);
        return std::nullopt;
    }
    if (!result.payload.is_object()) {
        return nlohmann::json::array();
    }
    return result.payload.value("coins", nlohmann::json::array());
}

std::optional<std::vector<CandidateSuggestion>> CoinGeckoDirectory::search(const std::string& query) {
    auto coins = searchPayload(query);
    if (!coins) {
        return std::nullopt;
    }

    std::vector<CandidateSuggestion> out;
    if (!coins->is_array()) {
        return out;
    }
    for (const auto& coin : *coins) {
        if (!hasStrings(coin, {"id", "symbol", "name"})) {
            continue;
        }
        out.push_back(CandidateSuggestion{
            coin["id"].get<std::string>(),
            toUpperCopy(coin["symbol"].get<std::string>()),
            coin["name"].get<std::string>()
        });
    }
    return out;
}

std::vector<CoinListing> CoinGeckoDirectory::searchCoins(const std::string& query, std::size_t limit) {
    std::vector<CoinListing> results;
    auto coins = searchPayload(query);
    if (!coins || !coins->is_array()) {
        return results;
    }

    const std::string query_lower = toLowerCopy(query);
    for (const auto& coin : *coins) {
        if (!hasStrings(coin, {"id", "symbol", "name"})) {
            continue;
        }
        const std::string symbol = coin["symbol"].get<std::string>();
        const std::string name = coin["name"].get<std::string>();
        if (toLowerCopy(symbol).find(query_lower) == std::string::npos &&
            toLowerCopy(name).find(query_lower) == std::string::npos) {
            continue;
        }

        CoinListing listing;
        listing.id = coin["id"].get<std::string>();
        listing.code = toUpperCopy(symbol);
        listing.name = name;
        listing.market_cap_rank = readRank(coin);
        results.push_back(std::move(listing));
        if (results.size() >= limit) {
            break;
        }
    }
    return results;
}

std::vector<CoinListing> CoinGeckoDirectory::topCoins(int limit) {
    std::vector<CoinListing> results;

    std::map<std::string, std::string> params;
    params["vs_currency"] = endpoints_.vs_currency;
    params["order"] = "market_cap_desc";
    params["per_page"] = std::to_string(std::clamp(limit, 1, 250));
    params["page"] = "1";
    params["sparkline"] = "false";

    auto result = fetch_->fetch(endpoints_.base_url + "/coins/markets", params, headers());
    if (!result.ok() || !result.payload.is_array()) {
        LOG_ERROR("Error fetching top cryptocurrencies");
        return results;
    }

    for (const auto& coin : result.payload) {
        if (!hasStrings(coin, {"id", "symbol", "name"})) {
            continue;
        }
        CoinListing listing;
        listing.id = coin["id"].get<std::string>();
        listing.code = toUpperCopy(coin["symbol"].get<std::string>());
        listing.name = coin["name"].get<std::string>();
        listing.market_cap_rank = readRank(coin);
        if (coin.contains("current_price")) {
            coerceNumber(coin["current_price"], listing.current_price);
        }
        if (coin.contains("price_change_percentage_24h")) {
            coerceNumber(coin["price_change_percentage_24h"], listing.price_change_pct_24h);
        }
        results.push_back(std::move(listing));
    }
    return results;
}

// ========== CoinGeckoChartSource ==========

CoinGeckoChartSource::CoinGeckoChartSource(std::shared_ptr<network::FetchClient> fetch, CoinGeckoEndpoints endpoints)
    : fetch_(std::move(fetch))
    , endpoints_(std::move(endpoints))
{
}

InstrumentMatch CoinGeckoChartSource::matchInstrument(const ResolvedSymbol& symbol) {
    InstrumentMatch match;
    match.instrument = symbol.id;
    match.listed = !symbol.id.empty();
    return match;
}

network::FetchResult CoinGeckoChartSource::requestSeries(const std::string& instrument, int window_days) {
    std::map<std::string, std::string> params;
    params["vs_currency"] = endpoints_.vs_currency;
    // 1일 이하는 5분봉이 내려오므로 최소 2일
    params["days"] = std::to_string(std::clamp(window_days, 2, 90));

    std::map<std::string, std::string> headers;
    if (!endpoints_.api_key.empty()) {
        headers["x-cg-demo-api-key"] = endpoints_.api_key;
    }
    return fetch_->fetch(endpoints_.base_url + "/coins/" + instrument + "/market_chart", params, headers);
}

std::vector<OHLCVSample> CoinGeckoChartSource::parseSeries(const nlohmann::json& payload, std::size_t& rejected) const {
    std::vector<OHLCVSample> samples;
    rejected = 0;
    if (!payload.is_object() || !payload.contains("prices") || !payload["prices"].is_array()) {
        LOG_ERROR("Unexpected market_chart payload ('prices' missing)");
        return samples;
    }

    std::map<long long, double> volumes;
    if (payload.contains("total_volumes") && payload["total_volumes"].is_array()) {
        for (const auto& point : payload["total_volumes"]) {
            long long ts = 0;
            double volume = 0.0;
            if (point.is_array() && point.size() >= 2 &&
                coerceInteger(point[0], ts) && coerceNumber(point[1], volume)) {
                volumes[ts] = volume;
            }
        }
    }

    const auto& prices = payload["prices"];
    samples.reserve(prices.size());
    for (const auto& point : prices) {
        long long ts = 0;
        double price = 0.0;
        if (!point.is_array() || point.size() < 2 ||
            !coerceInteger(point[0], ts) || !coerceNumber(point[1], price)) {
            rejected++;
            continue;
        }

        auto vol = volumes.find(ts);
        if (vol == volumes.end()) {
            rejected++;
            continue;
        }

        OHLCVSample s;
        s.open_time = ts;
        s.open = s.high = s.low = s.close = price;
        s.volume = vol->second;
        s.quote_volume = vol->second;
        s.close_time = ts + kBucketMs - 1;

        if (!isWellFormed(s)) {
            rejected++;
            continue;
        }
        samples.push_back(s);
    }
    return samples;
}

} // namespace market
} // namespace coinlens
