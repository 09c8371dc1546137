#pragma once

#include "common/Types.h"
#include "engine/LadderConfig.h"
#include "engine/LadderTypes.h"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace ladder {
namespace engine {

class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

// Leveled DCA ladder simulated one bar at a time.
//
// Per bar: watermark re-anchor, then sells, then buys (single pass over a
// snapshot of the quotes), then valuation at the close. Fills execute at the
// quoted price. Cash, positions, quotes and logs are consistent between bars.
class LadderEngine {
public:
    // Throws ConfigError when the configuration is invalid.
    explicit LadderEngine(LadderConfig config);

    // Throws DataError on an empty or non-chronological series.
    static void validateSeries(const std::vector<Candle>& candles);

    // Resets all state and seeds the quotes from the first bar's close.
    void initialize(const Candle& first);

    // Processes one bar; initializes on the first call if needed.
    // Throws DataError if the bar is not strictly after the previous one.
    void step(const Candle& candle);

    // Validates and processes the whole series from a fresh state.
    void run(const std::vector<Candle>& candles);

    bool isInitialized() const { return initialized_; }
    const LadderConfig& config() const { return config_; }
    double initialCash() const { return initial_cash_; }
    double cash() const { return cash_; }
    double highWatermark() const { return high_watermark_; }
    const std::map<int, Price>& pendingOrders() const { return pending_orders_; }
    const std::vector<LadderPosition>& openPositions() const { return positions_; }
    const std::vector<TradeRecord>& tradeLog() const { return trade_log_; }
    const std::vector<EquitySample>& equityCurve() const { return equity_curve_; }

    // Open-position value at the given price plus cash.
    double portfolioValue(double price) const;

    // Final cash implied by the trade log.
    static double replayCash(double initial_cash, const std::vector<TradeRecord>& trades);

private:
    double upTriggerPrice(const Candle& candle) const;
    double downTriggerPrice(const Candle& candle) const;

    void seedOrders(double reference_price);
    void updateWatermark(const Candle& candle);
    void processSells(const Candle& candle);
    void processBuys(const Candle& candle);
    void recordEquity(const Candle& candle);

    void placeOrder(int level, double limit_price);

    LadderConfig config_;
    double initial_cash_ = 0.0;

    bool initialized_ = false;
    double cash_ = 0.0;
    double high_watermark_ = 0.0;
    TimestampMs last_timestamp_ = 0;
    long long position_seq_ = 0;

    std::map<int, Price> pending_orders_;       // level -> limit price
    std::vector<LadderPosition> positions_;
    std::vector<TradeRecord> trade_log_;
    std::vector<EquitySample> equity_curve_;
};

} // namespace engine
} // namespace ladder
