#pragma once

#include "engine/LadderTypes.h"

#include <optional>
#include <vector>

namespace ladder {
namespace analytics {

struct PerformanceSettings {
    double risk_free_rate = 0.0;     // annual
    int periods_per_year = 365;      // daily bars
};

struct PerformanceReport {
    double initial_value = 0.0;
    double final_value = 0.0;
    double total_profit = 0.0;
    double total_return = 0.0;
    double annualized_return = 0.0;
    double elapsed_years = 0.0;

    double max_drawdown = 0.0;           // <= 0, fraction of the running peak
    int longest_drawdown_days = 0;
    bool drawdown_open = false;          // last sample below its running peak

    double sharpe_ratio = 0.0;

    int buy_count = 0;
    int sell_count = 0;                  // closed trades
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    // nullopt: no closed trades; +inf: closed trades without a loss
    std::optional<double> profit_factor;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double expectancy = 0.0;
};

// Stateless metrics over a finished run
class PerformanceAnalyzer {
public:
    PerformanceAnalyzer() = default;
    explicit PerformanceAnalyzer(PerformanceSettings settings);

    PerformanceReport compute(const std::vector<engine::EquitySample>& curve,
                              const std::vector<engine::TradeRecord>& trades,
                              double starting_capital) const;

    const PerformanceSettings& settings() const { return settings_; }

    static double totalReturn(double initial_value, double final_value);
    static double annualizedReturn(double initial_value, double final_value, double years);
    static double maxDrawdown(const std::vector<double>& values);

    struct DrawdownSpan {
        int longest_days = 0;
        bool open_at_end = false;
    };
    static DrawdownSpan longestDrawdown(const std::vector<engine::EquitySample>& curve);

    double sharpeRatio(const std::vector<double>& values) const;

private:
    PerformanceSettings settings_;
};

} // namespace analytics
} // namespace ladder
