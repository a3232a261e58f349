#pragma once

#include <string>
#include <vector>

#include "market/SymbolResolver.h"

namespace coinlens {
namespace engine {

// 시계열 소스
enum class SeriesSourceKind {
    EXCHANGE,       // 거래소 1시간봉 (klines)
    AGGREGATOR      // 애그리게이터 시간별 가격 차트 (OHLC 근사)
};

// 엔진 설정
struct EngineConfig {
    // 네트워크
    long timeout_seconds;
    int max_retries;
    long long backoff_base_ms;              // 429: base * 2^attempt
    long long transient_retry_delay_ms;     // 전송 오류 시 고정 대기
    std::string user_agent = "coinlens/1.0";

    // 거래소
    std::string exchange_base_url = "https://api.binance.com";
    std::vector<std::string> quote_priority{"USDT", "BTC"};
    int exchange_requests_per_second = 20;

    // 애그리게이터
    std::string aggregator_base_url = "https://api.coingecko.com/api/v3";
    std::string vs_currency = "usd";
    int aggregator_requests_per_minute = 30;
    std::string aggregator_api_key;         // 환경 변수에서만 읽음

    // 분석
    int window_days;
    market::ResolutionMode resolution_mode;
    SeriesSourceKind series_source;
    std::size_t max_suggestions;
    std::string reference_id = "bitcoin";
    std::string reference_code = "BTC";
    std::string reference_name = "Bitcoin";

    EngineConfig()
        : timeout_seconds(10)
        , max_retries(3)
        , backoff_base_ms(1000)
        , transient_retry_delay_ms(1000)
        , window_days(30)
        , resolution_mode(market::ResolutionMode::COIN_CATALOG)
        , series_source(SeriesSourceKind::EXCHANGE)
        , max_suggestions(5)
    {}
};

const char* toString(SeriesSourceKind kind);

} // namespace engine
} // namespace coinlens
