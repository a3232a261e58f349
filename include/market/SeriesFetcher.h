#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "market/IMarketDataSource.h"

namespace coinlens {
namespace market {

struct SeriesBatch {
    std::string instrument;
    std::vector<OHLCVSample> samples;     // empty = no data
    std::size_t rejected_rows = 0;
    bool listed = true;
    bool catalog_available = true;
    std::optional<network::FetchError> error;

    bool upstreamFailed() const { return error.has_value(); }
};

// Numeric coercion shared by the series parsers: accepts JSON numbers and
// numeric strings, rejects anything else (no zero-fill).
bool coerceNumber(const nlohmann::json& value, double& out);
bool coerceInteger(const nlohmann::json& value, long long& out);

// all numeric fields finite and non-negative
bool isWellFormed(const OHLCVSample& sample);

class SeriesFetcher {
public:
    explicit SeriesFetcher(std::shared_ptr<ISeriesSource> source);

    // 최근 window_days * 24 시간봉. 실패해도 예외 없이 빈 samples 반환
    SeriesBatch fetchSeries(const ResolvedSymbol& symbol, int window_days);

    std::string sourceName() const { return source_->name(); }

private:
    std::shared_ptr<ISeriesSource> source_;
};

} // namespace market
} // namespace coinlens
