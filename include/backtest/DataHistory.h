#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace ladder {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Accepted rows: timestamp,open,high,low,close[,volume] or timestamp,close
    // Timestamps: epoch seconds/milliseconds or YYYY-MM-DD[ HH:MM:SS] (UTC)
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array (long, short or Upbit-style keys)
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Dispatch on extension
    static std::vector<Candle> load(const std::string& file_path);

    // Sort by time and keep the last candle of each timestamp
    static std::vector<Candle> normalize(std::vector<Candle> candles);

    // Inclusive UTC day range; empty bounds are open
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);

    // Epoch ms from an integer string or a UTC date/time; throws std::invalid_argument
    static TimestampMs parseTimestamp(const std::string& value);

    static TimestampMs toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace ladder
