#include "analytics/PerformanceAnalyzer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace ladder {
namespace analytics {

namespace {
constexpr long long MS_PER_DAY = 86400000LL;
constexpr double DAYS_PER_YEAR = 365.25;

long long dayIndex(TimestampMs ts) {
    long long q = ts / MS_PER_DAY;
    if (ts % MS_PER_DAY != 0 && ts < 0) {
        --q;
    }
    return q;
}

std::vector<double> portfolioValues(const std::vector<engine::EquitySample>& curve) {
    std::vector<double> values;
    values.reserve(curve.size());
    for (const auto& sample : curve) {
        values.push_back(sample.portfolio_value);
    }
    return values;
}
}

PerformanceAnalyzer::PerformanceAnalyzer(PerformanceSettings settings)
    : settings_(settings)
{}

double PerformanceAnalyzer::totalReturn(double initial_value, double final_value) {
    if (initial_value <= 0.0) {
        return 0.0;
    }
    return (final_value - initial_value) / initial_value;
}

double PerformanceAnalyzer::annualizedReturn(double initial_value, double final_value, double years) {
    if (years <= 0.0 || initial_value <= 0.0 || final_value < 0.0) {
        return totalReturn(initial_value, final_value);
    }
    return std::pow(final_value / initial_value, 1.0 / years) - 1.0;
}

double PerformanceAnalyzer::maxDrawdown(const std::vector<double>& values) {
    double running_max = 0.0;
    double worst = 0.0;
    bool first = true;
    for (double v : values) {
        if (first || v > running_max) {
            running_max = v;
            first = false;
        }
        if (running_max > 0.0) {
            worst = std::min(worst, (v - running_max) / running_max);
        }
    }
    return worst;
}

PerformanceAnalyzer::DrawdownSpan PerformanceAnalyzer::longestDrawdown(
    const std::vector<engine::EquitySample>& curve)
{
    DrawdownSpan span;
    if (curve.empty()) {
        return span;
    }

    double running_max = curve.front().portfolio_value;
    bool in_drawdown = false;
    long long start_day = 0;

    for (const auto& sample : curve) {
        if (sample.portfolio_value < running_max) {
            const long long day = dayIndex(sample.timestamp);
            if (!in_drawdown) {
                in_drawdown = true;
                start_day = day;
            }
            const int days = static_cast<int>(day - start_day + 1);
            span.longest_days = std::max(span.longest_days, days);
        } else {
            in_drawdown = false;
            running_max = sample.portfolio_value;
        }
    }

    span.open_at_end = in_drawdown;
    return span;
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<double>& values) const {
    if (values.size() < 2 || settings_.periods_per_year <= 0) {
        return 0.0;
    }

    const double rf_per_bar = settings_.risk_free_rate / static_cast<double>(settings_.periods_per_year);
    std::vector<double> excess;
    excess.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1] <= 0.0) {
            continue;
        }
        excess.push_back((values[i] / values[i - 1] - 1.0) - rf_per_bar);
    }
    if (excess.size() < 2) {
        return 0.0;
    }

    const double n = static_cast<double>(excess.size());
    const double mean = std::accumulate(excess.begin(), excess.end(), 0.0) / n;
    double sq_sum = 0.0;
    for (double r : excess) {
        sq_sum += (r - mean) * (r - mean);
    }
    const double stddev = std::sqrt(sq_sum / (n - 1.0));
    if (stddev <= 1e-12) {
        return 0.0;
    }
    return (mean / stddev) * std::sqrt(static_cast<double>(settings_.periods_per_year));
}

PerformanceReport PerformanceAnalyzer::compute(const std::vector<engine::EquitySample>& curve,
                                               const std::vector<engine::TradeRecord>& trades,
                                               double starting_capital) const
{
    PerformanceReport report;
    report.initial_value = starting_capital;
    report.final_value = curve.empty() ? starting_capital : curve.back().portfolio_value;
    report.total_profit = report.final_value - report.initial_value;
    report.total_return = totalReturn(report.initial_value, report.final_value);

    if (curve.size() >= 2) {
        const double elapsed_ms = static_cast<double>(curve.back().timestamp - curve.front().timestamp);
        report.elapsed_years = elapsed_ms / (static_cast<double>(MS_PER_DAY) * DAYS_PER_YEAR);
    }
    report.annualized_return = annualizedReturn(report.initial_value, report.final_value,
                                                report.elapsed_years);

    const auto values = portfolioValues(curve);
    report.max_drawdown = maxDrawdown(values);
    const auto span = longestDrawdown(curve);
    report.longest_drawdown_days = span.longest_days;
    report.drawdown_open = span.open_at_end;
    report.sharpe_ratio = sharpeRatio(values);

    for (const auto& trade : trades) {
        if (!trade.isSell()) {
            report.buy_count++;
            continue;
        }
        report.sell_count++;
        if (trade.realized_pnl > 0.0) {
            report.winning_trades++;
            report.gross_profit += trade.realized_pnl;
        } else if (trade.realized_pnl < 0.0) {
            report.losing_trades++;
            report.gross_loss_abs += std::abs(trade.realized_pnl);
        }
    }

    if (report.sell_count > 0) {
        const double closed = static_cast<double>(report.sell_count);
        report.win_rate = static_cast<double>(report.winning_trades) / closed;
        report.expectancy = (report.gross_profit - report.gross_loss_abs) / closed;
        report.profit_factor = (report.gross_loss_abs > 0.0)
            ? (report.gross_profit / report.gross_loss_abs)
            : std::numeric_limits<double>::infinity();
    }
    report.avg_win = (report.winning_trades > 0)
        ? (report.gross_profit / static_cast<double>(report.winning_trades)) : 0.0;
    report.avg_loss = (report.losing_trades > 0)
        ? (report.gross_loss_abs / static_cast<double>(report.losing_trades)) : 0.0;

    return report;
}

} // namespace analytics
} // namespace ladder
