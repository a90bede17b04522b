#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace quantbench {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array, long (open/high/...) or short (o/h/...) keys
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Problems with the series; empty when usable by the engine
    static std::vector<std::string> validateSeries(const std::vector<Candle>& candles);

    // Candles with from_ms <= timestamp < to_ms
    static std::vector<Candle> sliceByTime(const std::vector<Candle>& candles,
                                           long long from_ms,
                                           long long to_ms);
};

} // namespace backtest
} // namespace quantbench
