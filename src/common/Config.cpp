#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace supergrid {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// spdlog 레벨 이름 (from_str 은 모르는 이름을 off 로 바꾼다)
std::string parseLogLevel(const std::string& value) {
    const std::string level = toLowerCopy(value);
    static const char* const kLevels[] = {
        "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"
    };
    for (const char* known : kLevels) {
        if (level == known) {
            return level;
        }
    }
    throw ConfigError("unknown logging.level: " + value);
}

std::filesystem::path resolveConfigPath(const std::string& path) {
    const std::filesystem::path given(path);
    if (given.is_absolute() || std::filesystem::exists(given)) {
        return given;
    }
    return utils::PathUtils::resolveRelativePath(path);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = resolveConfigPath(path);

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found: " << config_path << std::endl;
        std::cout << "Using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("malformed config file " + config_path.string() + ": " + e.what());
    }

    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    strategy::GridConfig grid_config = grid_config_;
    backtest::BacktestSettings backtest_settings = backtest_settings_;

    try {
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level = parseLogLevel(l.value("level", std::string("info")));
            log_dir = l.value("dir", std::string("logs"));
        }

        if (j.contains("super_grid")) {
            grid_config = parseGridConfig(j["super_grid"]);
        }

        if (j.contains("backtest")) {
            backtest_settings = parseBacktestSettings(j["backtest"]);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    } catch (const strategy::GridConfigError& e) {
        throw ConfigError(std::string("invalid super_grid section: ") + e.what());
    }

    log_level_ = log_level;
    log_dir_ = log_dir;
    grid_config_ = grid_config;
    backtest_settings_ = backtest_settings;

    std::cout << "Config loaded: symbol=" << grid_config_.vt_symbol
              << ", corridor=[" << grid_config_.lower_price << ", " << grid_config_.upper_price << "]"
              << ", trigger=" << grid_config_.trigger_price << std::endl;
}

strategy::GridConfig Config::parseGridConfig(const nlohmann::json& s) {
    strategy::GridConfig c;

    c.vt_symbol = s.value("vt_symbol", c.vt_symbol);
    c.lower_price = s.value("lower_price", c.lower_price);
    c.upper_price = s.value("upper_price", c.upper_price);
    c.trigger_price = s.value("trigger_price", c.trigger_price);
    c.rise_percent = s.value("rise_percent", c.rise_percent);
    c.fall_down = s.value("fall_down", c.fall_down);
    c.fall_percent = s.value("fall_percent", c.fall_percent);
    c.rise_up = s.value("rise_up", c.rise_up);
    if (s.contains("order_type")) {
        c.order_type = strategy::orderTypeFromString(s["order_type"].get<std::string>());
    }
    c.order_volume = s.value("order_volume", c.order_volume);
    c.order_amount = s.value("order_amount", c.order_amount);
    c.max_position = s.value("max_position", c.max_position);
    c.min_position = s.value("min_position", c.min_position);
    c.multiple_order = s.value("multiple_order", c.multiple_order);
    c.deadline = s.value("deadline", c.deadline);
    c.give_up_bias = s.value("give_up_bias", c.give_up_bias);
    c.buy_offset = s.value("buy_offset", c.buy_offset);
    c.sell_offset = s.value("sell_offset", c.sell_offset);

    c.validate();
    return c;
}

backtest::BacktestSettings Config::parseBacktestSettings(const nlohmann::json& b) {
    backtest::BacktestSettings settings;
    settings.data_path = b.value("data_path", settings.data_path);
    settings.data_format = toLowerCopy(b.value("data_format", settings.data_format));
    if (b.contains("mode")) {
        settings.mode = replayModeFromString(b["mode"].get<std::string>());
    }
    settings.fee_rate = b.value("fee_rate", settings.fee_rate);
    settings.initial_position = b.value("initial_position", settings.initial_position);
    settings.initial_cash = b.value("initial_cash", settings.initial_cash);
    settings.journal_path = b.value("journal_path", settings.journal_path);

    if (settings.data_format != "csv" && settings.data_format != "json") {
        throw ConfigError("backtest.data_format must be csv or json: " + settings.data_format);
    }
    if (settings.fee_rate < 0.0) {
        throw ConfigError("backtest.fee_rate must not be negative");
    }
    return settings;
}

backtest::ReplayMode Config::replayModeFromString(const std::string& value) {
    const std::string lower = toLowerCopy(value);
    if (lower == "bar") {
        return backtest::ReplayMode::BAR;
    }
    if (lower == "tick") {
        return backtest::ReplayMode::TICK;
    }
    throw ConfigError("unknown replay mode: " + value);
}

} // namespace supergrid
