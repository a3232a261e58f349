#include "market/CatalogCache.h"
#include "market/BinanceMarketData.h"
#include "TestSupport.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using coinlens::market::CatalogCache;
using coinlens::market::ICatalogSource;
using coinlens::testing::FakeHttpClient;

namespace {
class FakeCatalogSource : public ICatalogSource {
public:
    enum class Mode { OK, FAIL, THROW };

    std::atomic<int> calls{0};
    std::atomic<Mode> mode{Mode::OK};
    std::chrono::milliseconds delay{0};
    std::set<std::string> pairs{"BTCUSDT", "ETHUSDT", "ETHBTC"};

    std::string name() const override { return "fake"; }

    std::optional<std::set<std::string>> fetchCatalog() override {
        calls++;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        switch (mode.load()) {
            case Mode::FAIL: return std::nullopt;
            case Mode::THROW: throw std::runtime_error("connection reset");
            case Mode::OK: break;
        }
        return pairs;
    }
};
}

int main() {
    // second call is served from memory
    {
        auto source = std::make_shared<FakeCatalogSource>();
        CatalogCache cache(source);
        assert(!cache.isPopulated());

        auto first = cache.getCatalog();
        auto second = cache.getCatalog();
        assert(source->calls == 1);
        assert(cache.fetchCount() == 1);
        assert(first == second);
        assert(first->count("BTCUSDT") == 1);
        assert(cache.isPopulated());
        assert(!cache.loadFailed());
    }

    // concurrent first callers share one population
    {
        auto source = std::make_shared<FakeCatalogSource>();
        source->delay = std::chrono::milliseconds(50);
        CatalogCache cache(source);

        std::vector<std::thread> workers;
        std::vector<std::size_t> sizes(16, 0);
        for (int i = 0; i < 16; ++i) {
            workers.emplace_back([&cache, &sizes, i]() {
                sizes[i] = cache.getCatalog()->size();
            });
        }
        for (auto& w : workers) w.join();

        assert(source->calls == 1);
        for (auto size : sizes) {
            assert(size == 3);
        }
    }

    // failure memoizes an empty catalog until refresh()
    {
        auto source = std::make_shared<FakeCatalogSource>();
        source->mode = FakeCatalogSource::Mode::FAIL;
        CatalogCache cache(source);

        assert(cache.getCatalog()->empty());
        assert(cache.loadFailed());
        assert(cache.getCatalog()->empty());
        assert(source->calls == 1);

        source->mode = FakeCatalogSource::Mode::OK;
        auto refreshed = cache.refresh();
        assert(refreshed->size() == 3);
        assert(!cache.loadFailed());
        assert(cache.fetchCount() == 2);
        assert(cache.getCatalog()->size() == 3);
        assert(source->calls == 2);
    }

    // an exception from the source degrades to an empty catalog
    {
        auto source = std::make_shared<FakeCatalogSource>();
        source->mode = FakeCatalogSource::Mode::THROW;
        CatalogCache cache(source);

        assert(cache.getCatalog()->empty());
        assert(cache.loadFailed());
        assert(cache.isPopulated());
    }

    // snapshot held by a reader survives a refresh
    {
        auto source = std::make_shared<FakeCatalogSource>();
        CatalogCache cache(source);
        auto before = cache.getCatalog();

        source->pairs = {"SOLUSDT"};
        auto after = cache.refresh();
        assert(before->size() == 3);
        assert(after->size() == 1 && after->count("SOLUSDT") == 1);
    }

    // exchange listing parsed from exchangeInfo
    {
        auto http = std::make_shared<FakeHttpClient>([](const std::string& url, const FakeHttpClient::Params&) {
            assert(FakeHttpClient::endsWith(url, "/api/v3/exchangeInfo"));
            return FakeHttpClient::respondJson(200, coinlens::testing::exchangeInfo({"BTCUSDT", "ETHBTC", "BNBUSDT"}));
        });
        auto fetch = std::make_shared<coinlens::network::FetchClient>(http);
        CatalogCache cache(std::make_shared<coinlens::market::BinanceExchangeInfo>(fetch));

        auto catalog = cache.getCatalog();
        assert(catalog->size() == 3);
        assert(catalog->count("ETHBTC") == 1);
        assert(!cache.loadFailed());
    }

    // exchangeInfo without a symbols array counts as a failed load
    {
        auto http = std::make_shared<FakeHttpClient>([](const std::string&, const FakeHttpClient::Params&) {
            return FakeHttpClient::respond(200, "{\"code\":-1121}");
        });
        auto fetch = std::make_shared<coinlens::network::FetchClient>(http);
        CatalogCache cache(std::make_shared<coinlens::market::BinanceExchangeInfo>(fetch));

        assert(cache.getCatalog()->empty());
        assert(cache.loadFailed());
    }

    std::cout << "[TEST] CatalogCache PASSED\n";
    return 0;
}
