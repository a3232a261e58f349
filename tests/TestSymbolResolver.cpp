#include "market/SymbolResolver.h"
#include "market/CoinGeckoMarketData.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>

using coinlens::CandidateSuggestion;
using coinlens::ResolvedSymbol;
using coinlens::market::CatalogCache;
using coinlens::market::ICatalogSource;
using coinlens::market::ICoinDirectory;
using coinlens::market::ResolutionKind;
using coinlens::market::ResolutionMode;
using coinlens::market::ResolverOptions;
using coinlens::market::SymbolResolver;
using coinlens::testing::FakeHttpClient;

namespace {
class StaticCatalog : public ICatalogSource {
public:
    explicit StaticCatalog(std::optional<std::set<std::string>> pairs) : pairs_(std::move(pairs)) {}
    std::string name() const override { return "static"; }
    std::optional<std::set<std::string>> fetchCatalog() override { return pairs_; }

private:
    std::optional<std::set<std::string>> pairs_;
};

class FakeDirectory : public ICoinDirectory {
public:
    std::map<std::string, ResolvedSymbol> coins;
    std::map<std::string, std::vector<CandidateSuggestion>> results;
    bool search_fails = false;
    int lookups = 0;
    int searches = 0;

    std::string name() const override { return "fake"; }

    std::optional<ResolvedSymbol> lookup(const std::string& id) override {
        lookups++;
        auto it = coins.find(id);
        if (it == coins.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::vector<CandidateSuggestion>> search(const std::string& query) override {
        searches++;
        if (search_fails) return std::nullopt;
        auto it = results.find(query);
        if (it == results.end()) return std::vector<CandidateSuggestion>{};
        return it->second;
    }
};

std::shared_ptr<CatalogCache> catalogOf(std::set<std::string> pairs) {
    return std::make_shared<CatalogCache>(std::make_shared<StaticCatalog>(std::move(pairs)));
}

ResolverOptions pairMode() {
    ResolverOptions options;
    options.mode = ResolutionMode::EXCHANGE_PAIR;
    return options;
}
}

int main() {
    // ===== exchange-pair form =====
    {
        SymbolResolver resolver(catalogOf({"XUSDT", "XBTC", "ETHBTC", "BTCUSDT"}), nullptr, pairMode());

        auto r = resolver.resolve("X");
        assert(r.kind == ResolutionKind::RESOLVED);
        assert(r.symbol->id == "XUSDT");
        assert(r.symbol->code == "X");

        // only the BTC quote exists
        auto eth = resolver.resolve(" eth ");
        assert(eth.resolved());
        assert(eth.symbol->id == "ETHBTC");

        auto missing = resolver.resolve("ZZZ");
        assert(missing.kind == ResolutionKind::NOT_FOUND);
        assert(missing.suggestions.empty());

        auto btc = resolver.resolve("btc");
        assert(btc.resolved() && btc.symbol->id == "BTCUSDT");

        assert(SymbolResolver::normalizePairInput("btc/usdt") == "BTCUSDT");
        assert(SymbolResolver::normalizePairInput("eth-") == "ETH");
    }

    // catalog fetched once for many resolutions
    {
        auto source = std::make_shared<StaticCatalog>(std::set<std::string>{"BTCUSDT"});
        auto cache = std::make_shared<CatalogCache>(source);
        SymbolResolver resolver(cache, nullptr, pairMode());
        for (int i = 0; i < 5; ++i) {
            assert(resolver.resolve("btc").resolved());
        }
        assert(cache->fetchCount() == 1);
    }

    // unreachable catalog: reported as unavailable, not as an unknown pair
    {
        auto cache = std::make_shared<CatalogCache>(std::make_shared<StaticCatalog>(std::nullopt));
        SymbolResolver resolver(cache, nullptr, pairMode());
        auto r = resolver.resolve("BTC");
        assert(r.kind == ResolutionKind::UNAVAILABLE);
        assert(!r.symbol && r.suggestions.empty());
        assert(cache->loadFailed());
    }

    // quote priority is configurable
    {
        ResolverOptions options = pairMode();
        options.quote_priority = {"BTC", "USDT"};
        SymbolResolver resolver(catalogOf({"ETHUSDT", "ETHBTC"}), nullptr, options);
        assert(resolver.resolve("ETH").symbol->id == "ETHBTC");

        auto pair = SymbolResolver::matchExchangePair("eth", {"ETHUSDT", "ETHBTC"});
        assert(pair && *pair == "ETHUSDT");
        assert(!SymbolResolver::matchExchangePair("", {"USDT"}));
    }

    // ===== coin-catalog form =====
    {
        auto directory = std::make_shared<FakeDirectory>();
        directory->coins["bitcoin"] = ResolvedSymbol{"bitcoin", "BTC", "Bitcoin"};
        SymbolResolver resolver(nullptr, directory);

        auto r = resolver.resolve("Bitcoin");
        assert(r.resolved());
        assert(r.symbol->id == "bitcoin");
        assert(r.symbol->code == "BTC");
        assert(r.symbol->name == "Bitcoin");
        assert(directory->searches == 0);
    }

    // lookup misses, search entry with the exact code wins (not the first entry)
    {
        auto directory = std::make_shared<FakeDirectory>();
        directory->results["eth"] = {
            {"ethereum-classic", "ETC", "Ethereum Classic"},
            {"ethereum", "eth", "Ethereum"},
            {"wrapped-eth", "WETH", "Wrapped Ether"}
        };
        SymbolResolver resolver(nullptr, directory);

        auto r = resolver.resolve("eth");
        assert(r.resolved());
        assert(r.symbol->id == "ethereum");
        assert(r.symbol->code == "ETH");
        assert(directory->lookups == 1);
        assert(directory->searches == 1);
    }

    // no exact code: first five entries in upstream order
    {
        auto directory = std::make_shared<FakeDirectory>();
        std::vector<CandidateSuggestion> many;
        for (int i = 0; i < 7; ++i) {
            many.push_back({"bit-" + std::to_string(i), "BT" + std::to_string(i), "Bit " + std::to_string(i)});
        }
        directory->results["bit"] = many;
        SymbolResolver resolver(nullptr, directory);

        auto r = resolver.resolve("bit");
        assert(r.kind == ResolutionKind::AMBIGUOUS);
        assert(!r.symbol);
        assert(r.suggestions.size() == 5);
        for (std::size_t i = 0; i < 5; ++i) {
            assert(r.suggestions[i].id == many[i].id);
        }
        assert(directory->lookups == 1);
    }

    // inputs that cannot be an id skip the lookup
    {
        auto directory = std::make_shared<FakeDirectory>();
        directory->results["doge killer"] = {{"doge-killer", "LEASH", "Doge Killer"}};
        SymbolResolver resolver(nullptr, directory);

        auto r = resolver.resolve("doge killer");
        assert(r.kind == ResolutionKind::AMBIGUOUS);
        assert(r.suggestions.size() == 1);
        assert(directory->lookups == 0);
    }

    // failed lookup of "doge", empty search
    {
        auto directory = std::make_shared<FakeDirectory>();
        SymbolResolver resolver(catalogOf({}), directory);
        auto r = resolver.resolve("doge");
        assert(r.kind == ResolutionKind::NOT_FOUND);
        assert(r.suggestions.empty());
        assert(directory->lookups == 1 && directory->searches == 1);
    }

    // fewer than five candidates are returned as they are
    {
        auto directory = std::make_shared<FakeDirectory>();
        directory->results["sol"] = {{"solana", "SOLANA", "Solana"}, {"solend", "SLND", "Solend"}};
        SymbolResolver resolver(nullptr, directory);

        auto r = resolver.resolve("sol");
        assert(r.kind == ResolutionKind::AMBIGUOUS);
        assert(r.suggestions.size() == 2);
    }

    // empty search result is NOT_FOUND, a failed search is UNAVAILABLE
    {
        auto directory = std::make_shared<FakeDirectory>();
        SymbolResolver resolver(nullptr, directory);
        auto r = resolver.resolve("qwertyuiop");
        assert(r.kind == ResolutionKind::NOT_FOUND);
        assert(r.suggestions.empty());

        directory->search_fails = true;
        auto outage = resolver.resolve("btc");
        assert(outage.kind == ResolutionKind::UNAVAILABLE);
        assert(outage.suggestions.empty());
        assert(!outage.symbol);
        assert(std::string(coinlens::market::toString(outage.kind)) == "UNAVAILABLE");
        assert(resolver.resolve("   ").kind == ResolutionKind::NOT_FOUND);
    }

    // deterministic for identical upstream responses
    {
        auto directory = std::make_shared<FakeDirectory>();
        directory->results["ab"] = {{"a1", "AB1", "A"}, {"a2", "AB2", "B"}};
        SymbolResolver resolver(nullptr, directory);
        auto first = resolver.resolve("ab");
        auto second = resolver.resolve("ab");
        assert(first.kind == second.kind);
        assert(first.suggestions.size() == second.suggestions.size());
        assert(first.suggestions[0].id == second.suggestions[0].id);
    }

    // mode names
    {
        assert(*coinlens::market::parseResolutionMode("coin_catalog") == ResolutionMode::COIN_CATALOG);
        assert(*coinlens::market::parseResolutionMode("exchange_pair") == ResolutionMode::EXCHANGE_PAIR);
        assert(!coinlens::market::parseResolutionMode("fuzzy"));
        assert(std::string(coinlens::market::toString(ResolutionKind::AMBIGUOUS)) == "AMBIGUOUS");
    }

    // ===== aggregator directory over HTTP =====
    {
        auto http = std::make_shared<FakeHttpClient>([](const std::string& url, const FakeHttpClient::Params& params) {
            if (FakeHttpClient::endsWith(url, "/coins/bitcoin")) {
                assert(params.at("tickers") == "false");
                return FakeHttpClient::respondJson(200, {{"id", "bitcoin"}, {"symbol", "btc"}, {"name", "Bitcoin"}});
            }
            if (FakeHttpClient::endsWith(url, "/search")) {
                nlohmann::json coins = nlohmann::json::array();
                coins.push_back({{"id", "bitcoin"}, {"symbol", "btc"}, {"name", "Bitcoin"}, {"market_cap_rank", 1}});
                coins.push_back({{"id", "wrapped-bitcoin"}, {"symbol", "wbtc"}, {"name", "Wrapped Bitcoin"}, {"market_cap_rank", 17}});
                coins.push_back({{"id", "bitcoin-cash"}, {"symbol", "bch"}, {"name", "Bitcoin Cash"}, {"market_cap_rank", nullptr}});
                coins.push_back({{"id", "broken"}, {"symbol", 5}});
                return FakeHttpClient::respondJson(200, {{"coins", coins}, {"exchanges", nlohmann::json::array()}});
            }
            if (FakeHttpClient::endsWith(url, "/coins/markets")) {
                assert(params.at("order") == "market_cap_desc");
                assert(params.at("per_page") == "2");
                nlohmann::json rows = nlohmann::json::array();
                rows.push_back({{"id", "bitcoin"}, {"symbol", "btc"}, {"name", "Bitcoin"},
                                {"market_cap_rank", 1}, {"current_price", 64000.5}, {"price_change_percentage_24h", -1.25}});
                rows.push_back({{"id", "ethereum"}, {"symbol", "eth"}, {"name", "Ethereum"},
                                {"market_cap_rank", 2}, {"current_price", 3100}, {"price_change_percentage_24h", nullptr}});
                return FakeHttpClient::respondJson(200, rows);
            }
            return FakeHttpClient::respond(404, "{\"error\":\"coin not found\"}");
        });
        auto fetch = std::make_shared<coinlens::network::FetchClient>(http);
        coinlens::market::CoinGeckoEndpoints endpoints;
        endpoints.api_key = "demo-key";
        auto directory = std::make_shared<coinlens::market::CoinGeckoDirectory>(fetch, endpoints);

        auto coin = directory->lookup("bitcoin");
        assert(coin && coin->code == "BTC" && coin->name == "Bitcoin");
        assert(!directory->lookup("btc"));
        assert(http->calls().front().headers.at("x-cg-demo-api-key") == "demo-key");

        auto found = directory->search("bitcoin");
        assert(found && found->size() == 3);
        assert((*found)[1].code == "WBTC");

        // "btc": symbol match for bitcoin and wbtc, name match for none else
        auto ranked = directory->searchCoins("btc");
        assert(ranked.size() == 2);
        assert(ranked[0].market_cap_rank && *ranked[0].market_cap_rank == 1);
        assert(ranked[1].id == "wrapped-bitcoin");

        auto cash = directory->searchCoins("cash");
        assert(cash.size() == 1 && !cash[0].market_cap_rank);

        assert(directory->searchCoins("bitcoin", 1).size() == 1);

        auto top = directory->topCoins(2);
        assert(top.size() == 2);
        assert(top[0].current_price == 64000.5);
        assert(top[0].price_change_pct_24h == -1.25);
        assert(top[1].code == "ETH");
        assert(top[1].price_change_pct_24h == 0.0);

        // resolver end-to-end on the aggregator directory
        SymbolResolver resolver(nullptr, directory);
        auto r = resolver.resolve("BTC");
        assert(r.resolved() && r.symbol->id == "bitcoin");
    }

    std::cout << "[TEST] SymbolResolver PASSED\n";
    return 0;
}
