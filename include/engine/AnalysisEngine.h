#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "analytics/IndicatorEngine.h"
#include "market/CoinGeckoMarketData.h"
#include "market/SeriesFetcher.h"
#include "market/SymbolResolver.h"

namespace coinlens {
namespace engine {

// 사용자에게 구분해서 보여줘야 하는 종료 상태
enum class AnalysisStatus {
    OK,
    NOT_FOUND,          // /search 안내
    AMBIGUOUS,          // suggestions 중 선택
    INSUFFICIENT_DATA,
    NETWORK_FAILURE,    // 잠시 후 재시도
    COMPUTATION_ERROR
};

struct AnalysisReport {
    AnalysisStatus status = AnalysisStatus::NOT_FOUND;
    std::string query;
    std::optional<ResolvedSymbol> symbol;
    std::string instrument;
    IndicatorSnapshot snapshot;             // status == OK 일 때만 유효
    IndicatorSnapshot reference;            // 실패 시 {price 0, rsi 50}
    bool reference_available = false;
    std::vector<CandidateSuggestion> suggestions;
    std::size_t sample_count = 0;
    std::string source;
    std::string detail;

    bool ok() const { return status == AnalysisStatus::OK; }
};

const char* toString(AnalysisStatus status);

// Resolver -> SeriesFetcher -> IndicatorEngine
class AnalysisEngine {
public:
    AnalysisEngine(
        const EngineConfig& config,
        std::shared_ptr<market::SymbolResolver> resolver,
        std::shared_ptr<market::SeriesFetcher> series,
        std::shared_ptr<market::CoinGeckoDirectory> listings = nullptr,
        analytics::IndicatorEngine indicators = analytics::IndicatorEngine()
    );

    // libcurl 클라이언트, rate limiter, 소스들을 설정대로 조립
    static std::unique_ptr<AnalysisEngine> create(const EngineConfig& config);

    AnalysisReport analyze(const std::string& user_input);

    // 요청마다 별도 스레드에서 실행
    std::future<AnalysisReport> analyzeAsync(const std::string& user_input);

    // 기준 자산 스냅샷. 실패 시 nullopt
    std::optional<IndicatorSnapshot> referenceSnapshot();

    std::vector<CoinListing> topCoins(int limit = 20);
    std::vector<CoinListing> searchCoins(const std::string& query, std::size_t limit = 10);

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<market::SymbolResolver> resolver_;
    std::shared_ptr<market::SeriesFetcher> series_;
    std::shared_ptr<market::CoinGeckoDirectory> listings_;
    analytics::IndicatorEngine indicators_;

    // 해석된 심볼 하나에 대한 fetch + compute (report.status 설정)
    void analyzeResolved(const ResolvedSymbol& symbol, AnalysisReport& report);
    void attachReference(AnalysisReport& report);
    bool isReference(const ResolvedSymbol& symbol) const;
};

nlohmann::json toJson(const AnalysisReport& report);

} // namespace engine
} // namespace coinlens
