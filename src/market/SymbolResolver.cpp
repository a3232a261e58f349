#include "market/SymbolResolver.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>

namespace coinlens {
namespace market {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimCopy(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}
} // namespace

const char* toString(ResolutionKind kind) {
    switch (kind) {
        case ResolutionKind::RESOLVED: return "RESOLVED";
        case ResolutionKind::AMBIGUOUS: return "AMBIGUOUS";
        case ResolutionKind::NOT_FOUND: return "NOT_FOUND";
        case ResolutionKind::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "NOT_FOUND";
}

std::optional<ResolutionMode> parseResolutionMode(const std::string& value) {
    const std::string normalized = toLowerCopy(trimCopy(value));
    if (normalized == "coin_catalog") return ResolutionMode::COIN_CATALOG;
    if (normalized == "exchange_pair") return ResolutionMode::EXCHANGE_PAIR;
    return std::nullopt;
}

SymbolResolver::SymbolResolver(
    std::shared_ptr<CatalogCache> catalog,
    std::shared_ptr<ICoinDirectory> directory,
    ResolverOptions options
)
    : catalog_(std::move(catalog))
    , directory_(std::move(directory))
    , options_(std::move(options))
{
}

SymbolResolution SymbolResolver::resolve(const std::string& user_input) {
    if (options_.mode == ResolutionMode::EXCHANGE_PAIR) {
        return resolveExchangePair(user_input);
    }
    return resolveCoin(user_input);
}

std::string SymbolResolver::normalizePairInput(const std::string& user_input) {
    std::string symbol = toUpperCopy(trimCopy(user_input));
    symbol.erase(std::remove_if(symbol.begin(), symbol.end(),
                                [](char c) { return c == '/' || c == '-'; }),
                 symbol.end());
    return symbol;
}

std::optional<std::string> SymbolResolver::matchExchangePair(
    const std::string& user_input,
    const std::set<std::string>& catalog,
    const std::vector<std::string>& quote_priority
) {
    const std::string symbol = normalizePairInput(user_input);
    if (symbol.empty()) {
        return std::nullopt;
    }

    for (const auto& quote : quote_priority) {
        const std::string pair = symbol + quote;
        if (catalog.count(pair) > 0) {
            return pair;
        }
    }
    return std::nullopt;
}

SymbolResolution SymbolResolver::resolveExchangePair(const std::string& user_input) {
    SymbolResolution result;
    if (!catalog_) {
        LOG_ERROR("Exchange pair resolution requested without a catalog");
        return result;
    }

    const auto catalog = catalog_->getCatalog();
    const auto pair = matchExchangePair(user_input, *catalog, options_.quote_priority);
    if (!pair) {
        if (catalog_->loadFailed()) {
            LOG_WARN("Trading pair catalog unavailable, cannot resolve {}", user_input);
            result.kind = ResolutionKind::UNAVAILABLE;
            return result;
        }
        LOG_WARN("No trading pair found for {}", user_input);
        return result;
    }

    const std::string base = normalizePairInput(user_input);
    result.kind = ResolutionKind::RESOLVED;
    result.symbol = ResolvedSymbol{*pair, base, base};
    return result;
}

SymbolResolution SymbolResolver::resolveCoin(const std::string& user_input) {
    SymbolResolution result;
    const std::string input = trimCopy(user_input);
    if (input.empty() || !directory_) {
        return result;
    }

    // 1. 정확한 id 조회 ("bitcoin")
    const std::string input_lower = toLowerCopy(input);
    if (looksLikeCoinId(input_lower)) {
        if (auto found = directory_->lookup(input_lower)) {
            result.kind = ResolutionKind::RESOLVED;
            result.symbol = std::move(*found);
            return result;
        }
    }

    // 2. 검색 - 심볼이 정확히 일치하는 첫 항목 우선
    const auto coins = directory_->search(input);
    if (!coins) {
        LOG_WARN("Coin search unavailable for '{}'", input);
        result.kind = ResolutionKind::UNAVAILABLE;
        return result;
    }
    if (coins->empty()) {
        LOG_INFO("No coin matches '{}'", input);
        return result;
    }

    const std::string symbol_upper = toUpperCopy(input);
    for (const auto& coin : *coins) {
        if (toUpperCopy(coin.code) == symbol_upper) {
            result.kind = ResolutionKind::RESOLVED;
            result.symbol = ResolvedSymbol{coin.id, toUpperCopy(coin.code), coin.name};
            return result;
        }
    }

    // 3. 후보 제안 (검색 순서 유지)
    const std::size_t count = std::min(options_.max_suggestions, coins->size());
    for (std::size_t i = 0; i < count; ++i) {
        const auto& coin = (*coins)[i];
        result.suggestions.push_back(CandidateSuggestion{coin.id, toUpperCopy(coin.code), coin.name});
    }
    result.kind = result.suggestions.empty() ? ResolutionKind::NOT_FOUND : ResolutionKind::AMBIGUOUS;
    return result;
}

bool SymbolResolver::looksLikeCoinId(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.';
    });
}

} // namespace market
} // namespace coinlens
