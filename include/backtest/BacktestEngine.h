#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/Types.h"
#include "common/Config.h"
#include "backtest/DataHistory.h"
#include "engine/LadderEngine.h"
#include "analytics/PerformanceAnalyzer.h"

namespace ladder {
namespace backtest {

class BacktestEngine {
public:
    BacktestEngine();

    // Initialize engine with configuration (throws engine::ConfigError)
    void init(const Config& config);

    // Load historical data, applying normalization and the date window from config
    void loadData(const std::string& file_path);

    // Use an in-memory series instead of a file
    void setData(std::vector<Candle> candles);

    // Run the ladder over the loaded series (throws engine::DataError)
    void run();

    struct Result {
        size_t bars = 0;
        double final_cash = 0.0;
        int open_positions = 0;
        int pending_orders = 0;
        double replayed_cash = 0.0;
        bool ledger_consistent = true;
        analytics::PerformanceReport metrics;
    };
    Result getResult() const;

    const engine::LadderEngine& ladder() const;
    const std::vector<Candle>& history() const { return history_data_; }

    // timestamp,portfolio_value,price,cash,open_positions,pending_orders
    bool writeEquityCurveCsv(const std::string& file_path) const;
    bool writeTradeJournal(const std::string& file_path) const;

    void logSummary() const;

private:
    std::vector<Candle> history_data_;
    bool normalize_data_ = false;
    std::string start_date_;
    std::string end_date_;

    std::unique_ptr<engine::LadderEngine> ladder_;
    analytics::PerformanceAnalyzer analyzer_;
    Result result_;
    bool completed_ = false;
};

} // namespace backtest
} // namespace ladder
