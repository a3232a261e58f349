#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>

namespace coinlens {
namespace analytics {

// RSI 계산 (Wilder's Smoothing 방식)
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. 초기 평균 (첫 period 개 변화량의 단순 평균)
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    // 2. Wilder's Smoothing (끝까지 순회)
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) {
        // 완전 횡보는 중립
        return (avg_gain < 0.0000001) ? 50.0 : 100.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

// MACD 계산 (MACD 선 = EMA(fast) - EMA(slow))
TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow
) {
    MACDResult result;

    if (fast <= 0 || slow <= 0 || prices.size() < static_cast<size_t>(slow)) {
        return result; // 0.0
    }

    // 두 EMA 모두 첫 가격에서 시작하므로 같은 시점끼리 바로 뺄 수 있음
    result.macd = calculateEMA(prices, fast) - calculateEMA(prices, slow);
    result.line_ready = true;
    return result;
}

// EMA 계산 (Exponential Moving Average)
// 첫 가격으로 시드, alpha = 2 / (period + 1)
double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return prices.back();

    double multiplier = 2.0 / (period + 1.0);

    double ema = prices.front();
    for (size_t i = 1; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema; // 최신 EMA
}

double TechnicalIndicators::calculateVolumeChange(const std::vector<double>& volumes, std::size_t lag) {
    if (lag == 0 || volumes.size() < lag + 1) {
        return 0.0;
    }

    double current = volumes.back();
    double previous = volumes[volumes.size() - 1 - lag];
    if (previous == 0.0) {
        return 0.0;
    }
    return (current - previous) / previous * 100.0;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<OHLCVSample>& samples) {
    std::vector<double> prices;
    prices.reserve(samples.size());

    for (const auto& sample : samples) {
        prices.push_back(sample.close);
    }

    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<OHLCVSample>& samples) {
    std::vector<double> volumes;
    volumes.reserve(samples.size());

    for (const auto& sample : samples) {
        volumes.push_back(sample.volume);
    }

    return volumes;
}

} // namespace analytics
} // namespace coinlens
