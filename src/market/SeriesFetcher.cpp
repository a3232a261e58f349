#include "market/SeriesFetcher.h"
#include "common/Logger.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace coinlens {
namespace market {

bool coerceNumber(const nlohmann::json& value, double& out) {
    if (value.is_number()) {
        out = value.get<double>();
        return std::isfinite(out);
    }
    if (!value.is_string()) {
        return false;
    }

    const auto& text = value.get_ref<const std::string&>();
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

bool coerceInteger(const nlohmann::json& value, long long& out) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<unsigned long long>();
        if (raw > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
            return false;
        }
        out = static_cast<long long>(raw);
        return true;
    }
    if (value.is_number_integer()) {
        out = value.get<long long>();
        return true;
    }
    double parsed = 0.0;
    if (!coerceNumber(value, parsed) || parsed != std::floor(parsed)) {
        return false;
    }
    // [-2^63, 2^63) 밖이면 long long 으로 표현 불가
    constexpr double kLimit = 9223372036854775808.0;
    if (parsed < -kLimit || parsed >= kLimit) {
        return false;
    }
    out = static_cast<long long>(parsed);
    return true;
}

bool isWellFormed(const OHLCVSample& sample) {
    const double fields[] = {
        sample.open, sample.high, sample.low, sample.close, sample.volume,
        sample.quote_volume, sample.taker_buy_base, sample.taker_buy_quote
    };
    for (double v : fields) {
        if (!std::isfinite(v) || v < 0.0) {
            return false;
        }
    }
    return sample.open_time >= 0 && sample.close_time >= 0 && sample.trade_count >= 0;
}

SeriesFetcher::SeriesFetcher(std::shared_ptr<ISeriesSource> source)
    : source_(std::move(source))
{
}

SeriesBatch SeriesFetcher::fetchSeries(const ResolvedSymbol& symbol, int window_days) {
    SeriesBatch batch;

    const auto match = source_->matchInstrument(symbol);
    batch.listed = match.listed;
    batch.catalog_available = match.catalog_available;
    if (!match.listed) {
        LOG_ERROR("No {} instrument found for {} ({})", source_->name(), symbol.code, symbol.id);
        return batch;
    }
    batch.instrument = match.instrument;

    const auto result = source_->requestSeries(match.instrument, window_days);
    if (!result.ok()) {
        LOG_ERROR("Error fetching series for {}: {} {}",
                  match.instrument, network::toString(result.error->kind), result.error->message);
        batch.error = result.error;
        return batch;
    }

    batch.samples = source_->parseSeries(result.payload, batch.rejected_rows);
    if (batch.rejected_rows > 0) {
        LOG_WARN("Dropped {} malformed rows for {}", batch.rejected_rows, match.instrument);
    }
    LOG_DEBUG("Fetched {} samples for {} from {}", batch.samples.size(), match.instrument, source_->name());
    return batch;
}

} // namespace market
} // namespace coinlens
