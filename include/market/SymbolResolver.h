#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/Types.h"
#include "market/CatalogCache.h"
#include "market/IMarketDataSource.h"

namespace coinlens {
namespace market {

enum class ResolutionKind {
    RESOLVED,
    AMBIGUOUS,   // suggestions non-empty
    NOT_FOUND,   // suggestions empty
    UNAVAILABLE  // catalog or search upstream unreachable, outcome unknown
};

enum class ResolutionMode {
    COIN_CATALOG,   // aggregator id lookup, then search
    EXCHANGE_PAIR   // {input}USDT, {input}BTC against the exchange catalog
};

struct SymbolResolution {
    ResolutionKind kind = ResolutionKind::NOT_FOUND;
    std::optional<ResolvedSymbol> symbol;
    std::vector<CandidateSuggestion> suggestions;

    bool resolved() const { return kind == ResolutionKind::RESOLVED; }
};

struct ResolverOptions {
    ResolutionMode mode = ResolutionMode::COIN_CATALOG;
    std::vector<std::string> quote_priority{"USDT", "BTC"};
    std::size_t max_suggestions = 5;
};

const char* toString(ResolutionKind kind);
std::optional<ResolutionMode> parseResolutionMode(const std::string& value);

class SymbolResolver {
public:
    SymbolResolver(
        std::shared_ptr<CatalogCache> catalog,
        std::shared_ptr<ICoinDirectory> directory,
        ResolverOptions options = ResolverOptions()
    );

    // 설정된 모드로 해석
    SymbolResolution resolve(const std::string& user_input);

    SymbolResolution resolveExchangePair(const std::string& user_input);
    SymbolResolution resolveCoin(const std::string& user_input);

    // 대문자화, '/' '-' 제거. "btc/usdt" -> "BTCUSDT"
    static std::string normalizePairInput(const std::string& user_input);

    // quote 우선순위대로 {input}{quote}를 카탈로그에서 찾음 (첫 매치)
    static std::optional<std::string> matchExchangePair(
        const std::string& user_input,
        const std::set<std::string>& catalog,
        const std::vector<std::string>& quote_priority = {"USDT", "BTC"}
    );

    const ResolverOptions& options() const { return options_; }

private:
    std::shared_ptr<CatalogCache> catalog_;
    std::shared_ptr<ICoinDirectory> directory_;
    ResolverOptions options_;

    static bool looksLikeCoinId(const std::string& value);
};

} // namespace market
} // namespace coinlens
