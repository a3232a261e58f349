#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "network/FetchClient.h"

namespace coinlens {
namespace market {

// Instrument listing of an exchange (tradable pair ids).
class ICatalogSource {
public:
    virtual ~ICatalogSource() = default;

    virtual std::string name() const = 0;

    // nullopt when the upstream could not be reached or parsed
    virtual std::optional<std::set<std::string>> fetchCatalog() = 0;
};

// Coin catalog of an aggregator (id lookup + relevance-ordered search).
class ICoinDirectory {
public:
    virtual ~ICoinDirectory() = default;

    virtual std::string name() const = 0;

    virtual std::optional<ResolvedSymbol> lookup(const std::string& id) = 0;

    // Entries in upstream relevance order; nullopt on upstream failure.
    virtual std::optional<std::vector<CandidateSuggestion>> search(const std::string& query) = 0;
};

struct InstrumentMatch {
    std::string instrument;
    bool listed = false;
    bool catalog_available = true;
};

// Hourly price/volume history.
class ISeriesSource {
public:
    virtual ~ISeriesSource() = default;

    virtual std::string name() const = 0;

    virtual InstrumentMatch matchInstrument(const ResolvedSymbol& symbol) = 0;

    virtual network::FetchResult requestSeries(const std::string& instrument, int window_days) = 0;

    // Rows that fail numeric coercion are skipped and counted in `rejected`.
    virtual std::vector<OHLCVSample> parseSeries(const nlohmann::json& payload, std::size_t& rejected) const = 0;
};

} // namespace market
} // namespace coinlens
