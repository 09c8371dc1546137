#include "backtest/BacktestEngine.h"
#include "backtest/TradeJournalJsonl.h"
#include "common/Logger.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace ladder {
namespace backtest {

namespace {
std::string formatProfitFactor(const std::optional<double>& pf) {
    if (!pf) {
        return "n/a";
    }
    if (std::isinf(*pf)) {
        return "inf";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << *pf;
    return oss.str();
}

bool ensureParentDir(const std::string& file_path) {
    const std::filesystem::path p(file_path);
    if (!p.has_parent_path()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    return !ec;
}
}

BacktestEngine::BacktestEngine() = default;

void BacktestEngine::init(const Config& config) {
    ladder_ = std::make_unique<engine::LadderEngine>(config.getLadderConfig());
    analyzer_ = analytics::PerformanceAnalyzer(config.getPerformanceSettings());
    normalize_data_ = config.shouldNormalizeData();
    start_date_ = config.getStartDate();
    end_date_ = config.getEndDate();
    result_ = Result{};
    completed_ = false;

    const auto& cfg = ladder_->config();
    LOG_INFO("BacktestEngine initialized - Levels: {} | Cash: {:.2f} | Seeding: {} | Mode: {} | Re-anchor: {} @ {:.2f}%",
             cfg.levels.size(), ladder_->initialCash(),
             engine::toString(cfg.seeding), engine::toString(cfg.trigger_mode),
             engine::toString(cfg.reanchor_source), cfg.reanchor_threshold_pct * 100.0);
}

void BacktestEngine::loadData(const std::string& file_path) {
    setData(DataHistory::load(file_path));
}

void BacktestEngine::setData(std::vector<Candle> candles) {
    if (normalize_data_) {
        candles = DataHistory::normalize(std::move(candles));
    }
    if (!start_date_.empty() || !end_date_.empty()) {
        candles = DataHistory::filterByDate(candles, start_date_, end_date_);
    }
    history_data_ = std::move(candles);
    completed_ = false;
}

void BacktestEngine::run() {
    if (!ladder_) {
        throw std::logic_error("BacktestEngine::run called before init");
    }

    LOG_INFO("Starting Backtest with {} candles.", history_data_.size());
    ladder_->run(history_data_);

    result_ = Result{};
    result_.bars = history_data_.size();
    result_.final_cash = ladder_->cash();
    result_.open_positions = static_cast<int>(ladder_->openPositions().size());
    result_.pending_orders = static_cast<int>(ladder_->pendingOrders().size());
    result_.replayed_cash = engine::LadderEngine::replayCash(ladder_->initialCash(), ladder_->tradeLog());
    result_.ledger_consistent = (result_.replayed_cash == result_.final_cash);
    if (!result_.ledger_consistent) {
        LOG_ERROR("Cash ledger mismatch: engine={:.8f}, replay={:.8f}",
                  result_.final_cash, result_.replayed_cash);
    }
    result_.metrics = analyzer_.compute(ladder_->equityCurve(), ladder_->tradeLog(), ladder_->initialCash());
    completed_ = true;

    LOG_INFO("Backtest Completed.");
    LOG_INFO("Final Value: {:.2f}", result_.metrics.final_value);
}

BacktestEngine::Result BacktestEngine::getResult() const {
    return result_;
}

const engine::LadderEngine& BacktestEngine::ladder() const {
    if (!ladder_) {
        throw std::logic_error("BacktestEngine not initialized");
    }
    return *ladder_;
}

bool BacktestEngine::writeEquityCurveCsv(const std::string& file_path) const {
    if (!ladder_ || !completed_) {
        LOG_WARN("Equity curve export skipped: no completed run");
        return false;
    }

    std::ofstream out;
    if (ensureParentDir(file_path)) {
        out.open(file_path, std::ios::trunc);
    }
    if (!out.is_open()) {
        LOG_WARN("Equity curve export failed: {}", file_path);
        return false;
    }

    out << "timestamp,portfolio_value,price,cash,open_positions,pending_orders\n";
    out << std::fixed << std::setprecision(8);
    for (const auto& s : ladder_->equityCurve()) {
        out << s.timestamp << "," << s.portfolio_value << "," << s.price << ","
            << s.cash << "," << s.open_positions << "," << s.pending_orders << "\n";
    }
    LOG_INFO("Equity curve written: {} ({} samples)", file_path, ladder_->equityCurve().size());
    return static_cast<bool>(out);
}

bool BacktestEngine::writeTradeJournal(const std::string& file_path) const {
    if (!ladder_ || !completed_) {
        LOG_WARN("Trade journal export skipped: no completed run");
        return false;
    }

    TradeJournalJsonl journal(file_path);
    if (!journal.rewriteAll(ladder_->tradeLog())) {
        LOG_WARN("Trade journal export failed: {}", file_path);
        return false;
    }
    LOG_INFO("Trade journal written: {} ({} records)", file_path, journal.lastSeq());
    return true;
}

void BacktestEngine::logSummary() const {
    const auto& m = result_.metrics;
    LOG_INFO("==================== Backtest Summary ====================");
    LOG_INFO("Bars: {} | Buys: {} | Sells: {} | Open: {} | Pending: {}",
             result_.bars, m.buy_count, m.sell_count, result_.open_positions, result_.pending_orders);
    LOG_INFO("Initial: {:.2f} | Final: {:.2f} | Cash: {:.2f} | Profit: {:.2f}",
             m.initial_value, m.final_value, result_.final_cash, m.total_profit);
    LOG_INFO("Total Return: {:.2f}% | Annualized: {:.2f}% ({:.2f}y)",
             m.total_return * 100.0, m.annualized_return * 100.0, m.elapsed_years);
    LOG_INFO("Max Drawdown: {:.2f}% | Longest Drawdown: {} days{}",
             m.max_drawdown * 100.0, m.longest_drawdown_days, m.drawdown_open ? " (open)" : "");
    LOG_INFO("Sharpe: {:.3f} | Profit Factor: {} | Win Rate: {:.1f}% | Expectancy: {:.2f}",
             m.sharpe_ratio, formatProfitFactor(m.profit_factor), m.win_rate * 100.0, m.expectancy);
    if (!result_.ledger_consistent) {
        LOG_WARN("Ledger replay differs: {:.8f}", result_.replayed_cash);
    }
}

} // namespace backtest
} // namespace ladder
