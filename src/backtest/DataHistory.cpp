#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <utility>
#include "common/Logger.h"

namespace supergrid {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

// Splits one CSV line; returns false for headers, short or malformed rows.
bool splitDataRow(const std::string& line, size_t min_cells, std::vector<std::string>& row) {
    row.clear();
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }

    if (row.size() < min_cells) return false;
    if (row[0].empty()) return false;
    if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
        // Header or malformed row.
        return false;
    }
    return true;
}

template<typename T>
void sortByTimestamp(std::vector<T>& rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const T& a, const T& b) {
        return a.timestamp < b.timestamp;
    });
}
} // namespace

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    std::vector<std::string> row;

    while (std::getline(file, line)) {
        if (!splitDataRow(line, 6, row)) continue;

        try {
            Candle candle;
            candle.timestamp = std::stoll(row[0]);
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTimestamp(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    auto pick = [](const nlohmann::json& item, const char* long_key, const char* short_key, double fallback) {
        if (item.contains(long_key)) return item[long_key].get<double>();
        if (item.contains(short_key)) return item[short_key].get<double>();
        return fallback;
    };

    nlohmann::json j;
    try {
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            if (item.contains("timestamp")) candle.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) candle.timestamp = item["t"].get<long long>();

            candle.open = pick(item, "open", "o", 0.0);
            candle.high = pick(item, "high", "h", 0.0);
            candle.low = pick(item, "low", "l", 0.0);
            candle.close = pick(item, "close", "c", 0.0);
            candle.volume = pick(item, "volume", "v", 0.0);

            candles.push_back(candle);
        }
        sortByTimestamp(candles);

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Tick> DataHistory::loadTickCSV(const std::string& file_path) {
    std::vector<Tick> ticks;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open tick CSV file: {}", file_path);
        return ticks;
    }

    std::string line;
    std::vector<std::string> row;

    while (std::getline(file, line)) {
        if (!splitDataRow(line, 4, row)) continue;

        try {
            Tick tick;
            tick.timestamp = std::stoll(row[0]);
            tick.last_price = std::stod(row[1]);
            tick.bid_price_1 = std::stod(row[2]);
            tick.ask_price_1 = std::stod(row[3]);
            ticks.push_back(tick);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing tick row: {} - {}", line, e.what());
        }
    }

    sortByTimestamp(ticks);
    LOG_INFO("Loaded {} ticks from {}", ticks.size(), file_path);
    return ticks;
}

} // namespace backtest
} // namespace supergrid
