#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"
#include "strategy/GridConfig.h"

namespace supergrid {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; malformed JSON or an invalid grid throws ConfigError.
    void load(const std::string& config_path);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    strategy::GridConfig getGridConfig() const { return grid_config_; }
    backtest::BacktestSettings getBacktestSettings() const { return backtest_settings_; }
    void setBacktestDataPath(const std::string& v) { backtest_settings_.data_path = v; }
    void setBacktestMode(backtest::ReplayMode v) { backtest_settings_.mode = v; }

    // "super_grid" 섹션 파싱 (누락 키는 기본값)
    static strategy::GridConfig parseGridConfig(const nlohmann::json& j);
    static backtest::BacktestSettings parseBacktestSettings(const nlohmann::json& j);
    static backtest::ReplayMode replayModeFromString(const std::string& value);

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    strategy::GridConfig grid_config_;
    backtest::BacktestSettings backtest_settings_;
};

} // namespace supergrid
