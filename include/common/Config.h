#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace coinlens {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // 테스트/재로드용: 기본값으로 되돌림
    void reset();

    std::string getApiKey() const { return api_key_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    bool isLoaded() const { return loaded_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    void setWindowDays(int days) { engine_config_.window_days = days; }

private:
    Config() = default;
    std::string api_key_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    bool loaded_ = false;

    engine::EngineConfig engine_config_;

    void applyFetch(const nlohmann::json& f);
    void applyExchange(const nlohmann::json& e);
    void applyAggregator(const nlohmann::json& a);
    void applyAnalysis(const nlohmann::json& a);
};

} // namespace coinlens
