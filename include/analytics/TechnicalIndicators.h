#pragma once

#include <vector>
#include "common/Types.h"

namespace coinlens {
namespace analytics {

// Technical Indicators - 종가 시계열 기반
class TechnicalIndicators {
public:
    // RSI (Relative Strength Index) - Wilder's smoothing
    // 데이터 부족 시 50 (중립), 손실이 전혀 없으면 100
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // MACD (Moving Average Convergence Divergence) - MACD 선만
    struct MACDResult {
        double macd;        // MACD 선
        bool line_ready;    // prices.size() >= slow

        MACDResult() : macd(0), line_ready(false) {}
    };
    static MACDResult calculateMACD(const std::vector<double>& prices, int fast = 12, int slow = 26);

    // EMA (Exponential Moving Average) - 첫 가격으로 시드 후 누적
    // 데이터가 period 미만이면 마지막 가격
    static double calculateEMA(const std::vector<double>& prices, int period);

    // 거래량 변화율 (%) - 마지막 값 vs lag 개 이전 값, 이전 값이 0이면 0
    static double calculateVolumeChange(const std::vector<double>& volumes, std::size_t lag);

    // Helper: 가격 / 거래량 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<OHLCVSample>& samples);
    static std::vector<double> extractVolumes(const std::vector<OHLCVSample>& samples);
};

} // namespace analytics
} // namespace coinlens
