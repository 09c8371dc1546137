#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include "common/Logger.h"

namespace ladder {
namespace backtest {

namespace {
// Below this an integer timestamp is taken as epoch seconds
constexpr long long SECONDS_CUTOFF = 100000000000LL;

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

bool isIntegerString(const std::string& s) {
    if (s.empty()) return false;
    size_t i = (s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(i), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

double readNumber(const nlohmann::json& item, const char* long_key, const char* short_key,
                  const char* upbit_key, double fallback) {
    if (item.contains(long_key)) return item[long_key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    if (upbit_key != nullptr && item.contains(upbit_key)) return item[upbit_key].get<double>();
    return fallback;
}
}

TimestampMs DataHistory::toMsTimestamp(long long ts) {
    if (ts > -SECONDS_CUTOFF && ts < SECONDS_CUTOFF) {
        return ts * 1000LL;
    }
    return ts;
}

TimestampMs DataHistory::parseTimestamp(const std::string& raw) {
    const std::string value = trim(raw);
    if (isIntegerString(value)) {
        return toMsTimestamp(std::stoll(value));
    }

    std::tm tm{};
    std::istringstream iss(value);
    if (value.find(' ') != std::string::npos || value.find('T') != std::string::npos) {
        std::string normalized = value;
        std::replace(normalized.begin(), normalized.end(), 'T', ' ');
        iss.str(normalized);
        iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        iss >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (iss.fail()) {
        throw std::invalid_argument("unrecognized timestamp: " + value);
    }
    return static_cast<TimestampMs>(timegm(&tm)) * 1000LL;
}

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

        if (row.size() < 2 || row.size() == 3 || row.size() == 4) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            const TimestampMs ts = parseTimestamp(row[0]);
            if (row.size() == 2) {
                candles.push_back(Candle::fromClose(std::stod(row[1]), ts));
                continue;
            }
            Candle candle;
            candle.timestamp = ts;
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = (row.size() >= 6 && !row[5].empty()) ? std::stod(row[5]) : 0.0;
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

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

    nlohmann::json j;
    try {
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            if (item.contains("timestamp")) {
                const auto& t = item["timestamp"];
                candle.timestamp = t.is_string() ? parseTimestamp(t.get<std::string>())
                                                 : toMsTimestamp(t.get<long long>());
            } else if (item.contains("t")) {
                candle.timestamp = toMsTimestamp(item["t"].get<long long>());
            } else if (item.contains("date")) {
                candle.timestamp = parseTimestamp(item["date"].get<std::string>());
            }

            candle.close = readNumber(item, "close", "c", "trade_price", 0.0);
            candle.open = readNumber(item, "open", "o", "opening_price", candle.close);
            candle.high = readNumber(item, "high", "h", "high_price", candle.close);
            candle.low = readNumber(item, "low", "l", "low_price", candle.close);
            candle.volume = readNumber(item, "volume", "v", "candle_acc_trade_volume", 0.0);

            candles.push_back(candle);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    if (file_path.size() >= 5 && file_path.compare(file_path.size() - 5, 5, ".json") == 0) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::normalize(std::vector<Candle> candles) {
    const size_t before = candles.size();
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<Candle> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) {
        if (!out.empty() && out.back().timestamp == candle.timestamp) {
            out.back() = candle;
        } else {
            out.push_back(candle);
        }
    }

    if (out.size() != before) {
        LOG_WARN("Normalized series: dropped {} duplicate timestamps", before - out.size());
    }
    return out;
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    constexpr TimestampMs DAY_MS = 86400000LL;
    const bool has_start = !trim(start_date).empty();
    const bool has_end = !trim(end_date).empty();
    const TimestampMs start_ms = has_start ? parseTimestamp(start_date) : 0;
    // End date covers the whole day
    const TimestampMs end_ms = has_end ? parseTimestamp(end_date) + DAY_MS : 0;

    std::vector<Candle> out;
    for (const auto& candle : candles) {
        if (has_start && candle.timestamp < start_ms) continue;
        if (has_end && candle.timestamp >= end_ms) continue;
        out.push_back(candle);
    }
    return out;
}

} // namespace backtest
} // namespace ladder
