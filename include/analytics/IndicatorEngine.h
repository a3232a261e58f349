#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace coinlens {
namespace analytics {

enum class IndicatorStatus {
    OK,
    INSUFFICIENT_DATA,
    COMPUTATION_ERROR
};

struct IndicatorOutcome {
    IndicatorStatus status = IndicatorStatus::COMPUTATION_ERROR;
    IndicatorSnapshot snapshot;     // valid only when status == OK
    std::size_t valid_samples = 0;  // rows left after ingest
    std::size_t dropped_samples = 0;
    std::string detail;

    bool ok() const { return status == IndicatorStatus::OK; }
};

struct IndicatorSettings {
    int rsi_period = 14;
    int ema_short_period = 20;
    int ema_long_period = 50;
    int macd_fast = 12;
    int macd_slow = 26;
    std::size_t volume_long_lookback = 24;
    std::size_t min_samples = 50;
};

const char* toString(IndicatorStatus status);

class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorSettings settings = IndicatorSettings());

    // 정렬/중복 제거 -> 최소 샘플 게이트 -> 지표 계산 -> 반올림
    // 일부만 채워진 snapshot은 반환하지 않음
    IndicatorOutcome compute(const std::vector<OHLCVSample>& samples) const;

    // Drops malformed rows, orders by open_time and keeps the first row of each timestamp.
    static std::vector<OHLCVSample> ingest(const std::vector<OHLCVSample>& samples);

    static double roundTo(double value, int digits);

    const IndicatorSettings& settings() const { return settings_; }

private:
    IndicatorSettings settings_;
};

nlohmann::json snapshotToJson(const IndicatorSnapshot& snapshot);

} // namespace analytics
} // namespace coinlens
