#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"

#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

using namespace supergrid;

namespace {
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;
constexpr int kExitRuntime = 3;

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config path] [--data path] [--mode bar|tick]\n"
              << "  --config  JSON config (default: config/config.json)\n"
              << "  --data    bar CSV/JSON or tick CSV, overrides backtest.data_path\n"
              << "  --mode    replay mode, overrides backtest.mode\n";
}

void printResult(const backtest::BacktestEngine::Result& r) {
    std::cout << std::fixed << std::setprecision(8);
    std::cout << "\n===== Super Grid Backtest =====\n"
              << "Steps processed : " << r.steps_processed << "\n"
              << "Orders sent     : " << r.buy_orders_sent << " buy / " << r.sell_orders_sent << " sell\n"
              << "Trades          : " << r.total_trades << " (" << r.buy_trades << " buy / "
              << r.sell_trades << " sell)\n"
              << "Cancelled       : " << r.cancelled_orders << "\n"
              << "Sleep cycles    : " << r.sleep_cycles << "\n"
              << "Traded volume   : " << r.traded_volume << "\n"
              << "Turnover        : " << r.turnover << "\n"
              << "Fees            : " << r.total_fees << "\n"
              << "Final position  : " << r.final_position << "\n"
              << "Final cash      : " << r.final_cash << "\n"
              << "Final equity    : " << r.final_equity << " @ " << r.last_price << "\n"
              << "Max drawdown    : " << r.max_drawdown << "\n";
}
} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::string data_path;
    std::string mode;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = (i + 1 < argc);
        if (std::strcmp(arg, "--config") == 0 && has_value) {
            config_path = argv[++i];
        } else if (std::strcmp(arg, "--data") == 0 && has_value) {
            data_path = argv[++i];
        } else if (std::strcmp(arg, "--mode") == 0 && has_value) {
            mode = argv[++i];
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(argv[0]);
            return kExitOk;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return kExitUsage;
        }
    }

    Config& config = Config::getInstance();
    try {
        config.load(config_path);
        if (!data_path.empty()) {
            config.setBacktestDataPath(data_path);
        }
        if (!mode.empty()) {
            config.setBacktestMode(Config::replayModeFromString(mode));
        }
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return kExitConfig;
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return kExitRuntime;
    }

    const auto settings = config.getBacktestSettings();
    if (settings.data_path.empty()) {
        LOG_ERROR("No backtest data given (backtest.data_path or --data)");
        return kExitUsage;
    }

    try {
        backtest::BacktestEngine engine(config.getGridConfig(), settings);
        engine.loadData(settings.data_path);
        engine.run();
        printResult(engine.getResult());
    } catch (const strategy::GridConfigError& e) {
        LOG_ERROR("Grid config rejected: {}", e.what());
        return kExitConfig;
    } catch (const std::exception& e) {
        LOG_ERROR("Backtest failed: {}", e.what());
        return kExitRuntime;
    }

    spdlog::shutdown();
    return kExitOk;
}
