#include "analytics/IndicatorEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "market/SeriesFetcher.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace coinlens {
namespace analytics {

namespace {
constexpr int kPriceDigits = 2;
constexpr int kRsiDigits = 2;
constexpr int kMacdDigits = 4;
constexpr int kPercentDigits = 2;
}

const char* toString(IndicatorStatus status) {
    switch (status) {
        case IndicatorStatus::OK: return "OK";
        case IndicatorStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case IndicatorStatus::COMPUTATION_ERROR: return "COMPUTATION_ERROR";
    }
    return "UNKNOWN";
}

IndicatorEngine::IndicatorEngine(IndicatorSettings settings)
    : settings_(std::move(settings))
{
}

double IndicatorEngine::roundTo(double value, int digits) {
    if (!std::isfinite(value)) {
        return value;
    }
    const double scale = std::pow(10.0, digits);
    double rounded = std::round(value * scale) / scale;
    // -0.00 방지
    if (rounded == 0.0) {
        rounded = 0.0;
    }
    return rounded;
}

std::vector<OHLCVSample> IndicatorEngine::ingest(const std::vector<OHLCVSample>& samples) {
    std::vector<OHLCVSample> rows;
    rows.reserve(samples.size());
    for (const auto& sample : samples) {
        if (market::isWellFormed(sample)) {
            rows.push_back(sample);
        }
    }

    // stable: 같은 open_time 이면 먼저 들어온 행이 남음
    std::stable_sort(rows.begin(), rows.end(), [](const OHLCVSample& a, const OHLCVSample& b) {
        return a.open_time < b.open_time;
    });
    rows.erase(std::unique(rows.begin(), rows.end(), [](const OHLCVSample& a, const OHLCVSample& b) {
        return a.open_time == b.open_time;
    }), rows.end());

    return rows;
}

IndicatorOutcome IndicatorEngine::compute(const std::vector<OHLCVSample>& samples) const {
    IndicatorOutcome outcome;

    try {
        auto rows = ingest(samples);
        outcome.valid_samples = rows.size();
        outcome.dropped_samples = samples.size() - rows.size();

        if (rows.size() < settings_.min_samples) {
            outcome.status = IndicatorStatus::INSUFFICIENT_DATA;
            outcome.detail = "need " + std::to_string(settings_.min_samples) +
                             " samples, have " + std::to_string(rows.size());
            LOG_WARN("Insufficient data: {} valid samples (min {})", rows.size(), settings_.min_samples);
            return outcome;
        }

        const auto closes = TechnicalIndicators::extractClosePrices(rows);
        const auto volumes = TechnicalIndicators::extractVolumes(rows);
        const std::size_t n = closes.size();
        const double last_close = closes.back();

        IndicatorSnapshot snap;
        snap.sample_count = n;
        snap.as_of = rows.back().open_time;

        snap.rsi_warm = n >= static_cast<std::size_t>(settings_.rsi_period + 1);
        double rsi = TechnicalIndicators::calculateRSI(closes, settings_.rsi_period);

        snap.ema_short_warm = n >= static_cast<std::size_t>(settings_.ema_short_period);
        double ema_short = snap.ema_short_warm
            ? TechnicalIndicators::calculateEMA(closes, settings_.ema_short_period)
            : last_close;

        snap.ema_long_warm = n >= static_cast<std::size_t>(settings_.ema_long_period);
        double ema_long = snap.ema_long_warm
            ? TechnicalIndicators::calculateEMA(closes, settings_.ema_long_period)
            : last_close;

        auto macd = TechnicalIndicators::calculateMACD(closes, settings_.macd_fast, settings_.macd_slow);
        snap.macd_warm = macd.line_ready;

        double volume_short = TechnicalIndicators::calculateVolumeChange(volumes, 1);
        double volume_long = TechnicalIndicators::calculateVolumeChange(volumes, settings_.volume_long_lookback);

        const double raw[] = {last_close, rsi, ema_short, ema_long, macd.macd, volume_short, volume_long};
        for (double value : raw) {
            if (!std::isfinite(value)) {
                throw std::domain_error("non-finite indicator value");
            }
        }

        snap.price = roundTo(last_close, kPriceDigits);
        snap.rsi = roundTo(rsi, kRsiDigits);
        snap.ema_short = roundTo(ema_short, kPriceDigits);
        snap.ema_long = roundTo(ema_long, kPriceDigits);
        snap.macd = roundTo(macd.macd, kMacdDigits);
        snap.volume_change_short = roundTo(volume_short, kPercentDigits);
        snap.volume_change_long = roundTo(volume_long, kPercentDigits);

        outcome.snapshot = snap;
        outcome.status = IndicatorStatus::OK;
    } catch (const std::exception& e) {
        outcome = IndicatorOutcome();
        outcome.status = IndicatorStatus::COMPUTATION_ERROR;
        outcome.detail = e.what();
        LOG_ERROR("Indicator computation failed: {}", e.what());
    }

    return outcome;
}

nlohmann::json snapshotToJson(const IndicatorSnapshot& snapshot) {
    nlohmann::json j;
    j["price"] = snapshot.price;
    j["rsi"] = snapshot.rsi;
    j["ema_short"] = snapshot.ema_short;
    j["ema_long"] = snapshot.ema_long;
    j["macd"] = snapshot.macd;
    j["volume_change_short"] = snapshot.volume_change_short;
    j["volume_change_long"] = snapshot.volume_change_long;
    j["sample_count"] = snapshot.sample_count;
    j["as_of"] = snapshot.as_of;
    j["warm"] = {
        {"rsi", snapshot.rsi_warm},
        {"ema_short", snapshot.ema_short_warm},
        {"ema_long", snapshot.ema_long_warm},
        {"macd", snapshot.macd_warm}
    };
    return j;
}

} // namespace analytics
} // namespace coinlens
