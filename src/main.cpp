#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "engine/AnalysisEngine.h"

#include <nlohmann/json.hpp>

#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace coinlens;

namespace {

void printUsage() {
    std::cout << "Usage: coinlens [--config <path>] [--days <n>] SYMBOL...\n"
              << "       coinlens [--config <path>] --top [n]\n"
              << "       coinlens [--config <path>] --search <query>\n";
}

bool parsePositiveInt(const std::string& input, int& out) {
    if (input.empty()) {
        return false;
    }
    std::size_t used = 0;
    try {
        int value = std::stoi(input, &used);
        if (used != input.size() || value <= 0) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

nlohmann::json listingsToJson(const std::vector<CoinListing>& listings) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& coin : listings) {
        nlohmann::json row;
        row["id"] = coin.id;
        row["code"] = coin.code;
        row["name"] = coin.name;
        if (coin.market_cap_rank) {
            row["market_cap_rank"] = *coin.market_cap_rank;
        } else {
            row["market_cap_rank"] = nullptr;
        }
        row["current_price"] = coin.current_price;
        row["price_change_pct_24h"] = coin.price_change_pct_24h;
        out.push_back(row);
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "config/config.json";
        int window_days = 0;
        int top_limit = 0;
        std::string search_query;
        std::vector<std::string> symbols;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--days" && i + 1 < argc) {
                if (!parsePositiveInt(argv[++i], window_days)) {
                    std::cerr << "잘못된 --days 값: " << argv[i] << std::endl;
                    return 2;
                }
            } else if (arg == "--top") {
                top_limit = 20;
                if (i + 1 < argc && parsePositiveInt(argv[i + 1], top_limit)) {
                    ++i;
                }
            } else if (arg == "--search" && i + 1 < argc) {
                search_query = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "알 수 없는 옵션: " << arg << std::endl;
                printUsage();
                return 2;
            } else {
                symbols.push_back(arg);
            }
        }

        if (symbols.empty() && top_limit == 0 && search_query.empty()) {
            printUsage();
            return 2;
        }

        auto& config = Config::getInstance();
        config.load(config_path);
        if (window_days > 0) {
            config.setWindowDays(window_days);
        }

        Logger::getInstance().initialize(
            utils::PathUtils::resolve(config.getLogDir()).string(), config.getLogLevel());
        LOG_INFO("CoinLens 시작");

        auto engine = engine::AnalysisEngine::create(config.getEngineConfig());

        if (top_limit > 0) {
            std::cout << listingsToJson(engine->topCoins(top_limit)).dump(2) << std::endl;
        }
        if (!search_query.empty()) {
            std::cout << listingsToJson(engine->searchCoins(search_query)).dump(2) << std::endl;
        }

        // 심볼별 요청은 동시에 진행, 출력은 입력 순서대로
        std::vector<std::future<engine::AnalysisReport>> pending;
        pending.reserve(symbols.size());
        for (const auto& symbol : symbols) {
            pending.push_back(engine->analyzeAsync(symbol));
        }

        int exit_code = 0;
        for (auto& future : pending) {
            auto report = future.get();
            if (!report.ok()) {
                exit_code = 1;
            }
            std::cout << engine::toJson(report).dump(2) << std::endl;
        }

        LOG_INFO("Program terminated");
        return exit_code;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\n오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
