#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace coinlens {

using Price = double;
using Volume = double;

// 1시간 봉 하나 (open_time 기준 오름차순, 중복 없음)
struct OHLCVSample {
    long long open_time;
    Price open;
    Price high;
    Price low;
    Price close;
    Volume volume;
    long long close_time;
    Volume quote_volume;
    long long trade_count;
    Volume taker_buy_base;
    Volume taker_buy_quote;

    OHLCVSample()
        : open_time(0), open(0), high(0), low(0), close(0), volume(0)
        , close_time(0), quote_volume(0), trade_count(0)
        , taker_buy_base(0), taker_buy_quote(0) {}
};

// Resolver 결과 - 생성 후 변경하지 않음
struct ResolvedSymbol {
    std::string id;     // canonical id ("bitcoin", "BTCUSDT")
    std::string code;   // short code, upper-case ("BTC")
    std::string name;   // display name ("Bitcoin")
};

struct CandidateSuggestion {
    std::string id;
    std::string code;
    std::string name;
};

// 시가총액 순위 / 검색 결과 행
struct CoinListing {
    std::string id;
    std::string code;
    std::string name;
    std::optional<int> market_cap_rank;
    double current_price = 0.0;
    double price_change_pct_24h = 0.0;
};

struct IndicatorSnapshot {
    Price price = 0.0;
    double rsi = 50.0;
    Price ema_short = 0.0;
    Price ema_long = 0.0;
    double macd = 0.0;
    double volume_change_short = 0.0;   // last bucket vs previous, %
    double volume_change_long = 0.0;    // last bucket vs 24 buckets earlier, %

    std::size_t sample_count = 0;
    long long as_of = 0;

    // false = the indicator fell back to its default value
    bool rsi_warm = false;
    bool ema_short_warm = false;
    bool ema_long_warm = false;
    bool macd_warm = false;
};

} // namespace coinlens
