#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include "common/Logger.h"

namespace quantbench {
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

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

template <typename T>
T readField(const nlohmann::json& item, const char* long_key, const char* short_key, T fallback) {
    if (item.contains(long_key)) return item.at(long_key).get<T>();
    if (item.contains(short_key)) return item.at(short_key).get<T>();
    return fallback;
}

void sortByTime(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
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
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // header or malformed row
            continue;
        }

        try {
            candles.emplace_back(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                                 std::stod(row[4]), std::stod(row[5]), std::stoll(row[0]));
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTime(candles);
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

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON candle file is not an array: {}", file_path);
            return candles;
        }
        for (const auto& item : j) {
            Candle candle;
            candle.timestamp = readField<long long>(item, "timestamp", "t", 0LL);
            candle.open = readField<double>(item, "open", "o", 0.0);
            candle.high = readField<double>(item, "high", "h", 0.0);
            candle.low = readField<double>(item, "low", "l", 0.0);
            candle.close = readField<double>(item, "close", "c", 0.0);
            candle.volume = readField<double>(item, "volume", "v", 0.0);
            candles.push_back(candle);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
        return candles;
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<std::string> DataHistory::validateSeries(const std::vector<Candle>& candles) {
    std::vector<std::string> problems;
    for (size_t i = 0; i < candles.size(); ++i) {
        const Candle& c = candles[i];
        const std::string at = "candle " + std::to_string(i);

        if (i > 0 && c.timestamp <= candles[i - 1].timestamp) {
            problems.push_back(at + ": timestamp not strictly increasing");
        }
        if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
            !std::isfinite(c.low) || !std::isfinite(c.close)) {
            problems.push_back(at + ": non-finite price");
            continue;
        }
        if (c.high < c.low) {
            problems.push_back(at + ": high below low");
        }
        if (c.open > c.high || c.open < c.low || c.close > c.high || c.close < c.low) {
            problems.push_back(at + ": open/close outside high-low range");
        }
        if (c.low <= 0.0) {
            problems.push_back(at + ": non-positive price");
        }
        if (c.volume < 0.0) {
            problems.push_back(at + ": negative volume");
        }
    }
    return problems;
}

std::vector<Candle> DataHistory::sliceByTime(const std::vector<Candle>& candles,
                                             long long from_ms,
                                             long long to_ms) {
    std::vector<Candle> slice;
    for (const auto& c : candles) {
        if (c.timestamp >= from_ms && c.timestamp < to_ms) {
            slice.push_back(c);
        }
    }
    return slice;
}

} // namespace backtest
} // namespace quantbench
