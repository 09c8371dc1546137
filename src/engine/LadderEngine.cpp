#include "engine/LadderEngine.h"
#include "common/Logger.h"

#include <cmath>
#include <set>
#include <utility>

namespace ladder {
namespace engine {

LadderEngine::LadderEngine(LadderConfig config)
    : config_(std::move(config))
{
    validateLadderConfig(config_);
    initial_cash_ = config_.initialCash();
    cash_ = initial_cash_;
}

void LadderEngine::validateSeries(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        throw DataError("price series is empty");
    }

    for (size_t i = 0; i < candles.size(); ++i) {
        const Candle& c = candles[i];
        if (!std::isfinite(c.close) || c.close <= 0.0) {
            throw DataError("non-positive close at index " + std::to_string(i));
        }
        if (c.high < c.low) {
            throw DataError("high below low at index " + std::to_string(i));
        }
        if (i > 0 && c.timestamp <= candles[i - 1].timestamp) {
            throw DataError("timestamps not strictly increasing at index " + std::to_string(i) +
                            " (" + std::to_string(candles[i - 1].timestamp) + " -> " +
                            std::to_string(c.timestamp) + ")");
        }
    }
}

void LadderEngine::initialize(const Candle& first) {
    cash_ = initial_cash_;
    high_watermark_ = first.close;
    last_timestamp_ = first.timestamp;
    position_seq_ = 0;
    pending_orders_.clear();
    positions_.clear();
    trade_log_.clear();
    equity_curve_.clear();

    seedOrders(first.close);
    initialized_ = true;

    LOG_INFO("[Ladder] Initialized - P0: {:.2f} | Levels: {} | Cash: {:.2f} | Seeding: {} | Mode: {}",
             first.close, config_.levels.size(), cash_,
             toString(config_.seeding), toString(config_.trigger_mode));
}

void LadderEngine::step(const Candle& candle) {
    // Reject before touching any state
    if (!std::isfinite(candle.close) || candle.close <= 0.0) {
        throw DataError("non-positive close at " + std::to_string(candle.timestamp));
    }
    if (candle.high < candle.low) {
        throw DataError("high below low at " + std::to_string(candle.timestamp));
    }

    if (!initialized_) {
        initialize(candle);
    }

    if (!equity_curve_.empty() && candle.timestamp <= last_timestamp_) {
        throw DataError("bar at " + std::to_string(candle.timestamp) +
                        " is not after " + std::to_string(last_timestamp_));
    }
    last_timestamp_ = candle.timestamp;

    updateWatermark(candle);
    processSells(candle);
    processBuys(candle);
    recordEquity(candle);
}

void LadderEngine::run(const std::vector<Candle>& candles) {
    validateSeries(candles);

    initialized_ = false;
    for (const auto& candle : candles) {
        step(candle);
    }

    LOG_INFO("[Ladder] Run complete - Bars: {} | Trades: {} | Open: {} | Cash: {:.2f}",
             candles.size(), trade_log_.size(), positions_.size(), cash_);
}

double LadderEngine::portfolioValue(double price) const {
    double value = cash_;
    for (const auto& position : positions_) {
        value += position.size * price;
    }
    return value;
}

double LadderEngine::replayCash(double initial_cash, const std::vector<TradeRecord>& trades) {
    double cash = initial_cash;
    for (const auto& trade : trades) {
        if (trade.isSell()) {
            cash += trade.cash_delta;
        } else {
            cash -= trade.cash_delta;
        }
    }
    return cash;
}

double LadderEngine::upTriggerPrice(const Candle& candle) const {
    return config_.trigger_mode == TriggerMode::HIGH_LOW ? candle.high : candle.close;
}

double LadderEngine::downTriggerPrice(const Candle& candle) const {
    return config_.trigger_mode == TriggerMode::HIGH_LOW ? candle.low : candle.close;
}

void LadderEngine::seedOrders(double reference_price) {
    double anchor = reference_price;
    for (const auto& level : config_.levels) {
        const double quote = anchor * (1.0 - level.buy_pct);
        placeOrder(level.index, quote);
        if (config_.seeding == SeedingPolicy::CASCADE) {
            anchor = quote;
        }
    }
}

void LadderEngine::updateWatermark(const Candle& candle) {
    const double price = upTriggerPrice(candle);
    if (price <= high_watermark_ * (1.0 + config_.reanchor_threshold_pct)) {
        return;
    }

    high_watermark_ = price;

    auto it = pending_orders_.find(0);
    if (it == pending_orders_.end()) {
        return;
    }
    const double anchor = (config_.reanchor_source == ReanchorSource::WATERMARK)
        ? high_watermark_
        : candle.close;
    const double previous = it->second;
    placeOrder(0, anchor * (1.0 - config_.levels.front().buy_pct));

    LOG_DEBUG("[Ladder] Re-anchor - High: {:.2f} | Level 0: {:.2f} -> {:.2f}",
              high_watermark_, previous, pending_orders_[0]);
}

void LadderEngine::processSells(const Candle& candle) {
    if (positions_.empty()) {
        return;
    }

    const double trigger = upTriggerPrice(candle);
    const std::vector<LadderPosition> snapshot = positions_;
    std::vector<LadderPosition> remaining;
    remaining.reserve(snapshot.size());

    for (const auto& position : snapshot) {
        if (position.sell_target > trigger) {
            remaining.push_back(position);
            continue;
        }

        const double proceeds = position.size * position.sell_target;
        const double pnl = proceeds - position.size * position.entry_price;
        cash_ += proceeds;

        TradeRecord record;
        record.side = OrderSide::SELL;
        record.level = position.level;
        record.position_id = position.id;
        record.timestamp = candle.timestamp;
        record.price = position.sell_target;
        record.size = position.size;
        record.cash_delta = proceeds;
        record.entry_price = position.entry_price;
        record.realized_pnl = pnl;
        trade_log_.push_back(record);

        LOG_DEBUG("[Ladder] Sell - Level: {} | Entry: {:.2f} | Exit: {:.2f} | PnL: {:.2f} | Cash: {:.2f}",
                  position.level, position.entry_price, position.sell_target, pnl, cash_);
        Logger::getInstance().logTrade(candle.timestamp, "SELL", position.level,
                                       position.sell_target, position.size, cash_, pnl);

        const Level& level = config_.levels[static_cast<size_t>(position.level)];
        placeOrder(level.index, candle.close * (1.0 - level.buy_pct));
    }

    positions_.swap(remaining);
}

void LadderEngine::processBuys(const Candle& candle) {
    if (pending_orders_.empty()) {
        return;
    }

    const double trigger = downTriggerPrice(candle);
    const std::map<int, Price> snapshot = pending_orders_;
    const int last_level = static_cast<int>(config_.levels.size()) - 1;
    std::set<int> placed_this_pass;

    for (const auto& [level_index, limit] : snapshot) {
        // Quotes placed earlier in this pass wait for the next bar
        if (placed_this_pass.count(level_index) > 0) {
            continue;
        }
        auto live = pending_orders_.find(level_index);
        if (live == pending_orders_.end()) {
            continue;
        }
        if (limit < trigger) {
            continue;
        }

        const Level& level = config_.levels[static_cast<size_t>(level_index)];
        if (cash_ < level.allocation) {
            LOG_DEBUG("[Ladder] Buy deferred (cash) - Level: {} | Limit: {:.2f} | Cash: {:.2f} < {:.2f}",
                      level_index, limit, cash_, level.allocation);
            continue;
        }

        LadderPosition position;
        position.id = ++position_seq_;
        position.level = level_index;
        position.entry_price = limit;
        position.size = level.allocation / limit;
        position.sell_target = limit * (1.0 + level.sell_pct);
        position.opened_at = candle.timestamp;
        positions_.push_back(position);

        cash_ -= level.allocation;
        pending_orders_.erase(live);

        TradeRecord record;
        record.side = OrderSide::BUY;
        record.level = level_index;
        record.position_id = position.id;
        record.timestamp = candle.timestamp;
        record.price = limit;
        record.size = position.size;
        record.cash_delta = level.allocation;
        trade_log_.push_back(record);

        LOG_DEBUG("[Ladder] Buy - Level: {} | Price: {:.2f} | Size: {:.8f} | Target: {:.2f} | Cash: {:.2f}",
                  level_index, limit, position.size, position.sell_target, cash_);
        Logger::getInstance().logTrade(candle.timestamp, "BUY", level_index,
                                       limit, position.size, cash_, 0.0);

        if (level_index < last_level) {
            const Level& deeper = config_.levels[static_cast<size_t>(level_index + 1)];
            const double pct = level.next_buy_pct.value_or(deeper.buy_pct);
            placeOrder(deeper.index, limit * (1.0 - pct));
            placed_this_pass.insert(deeper.index);
        }
    }
}

void LadderEngine::recordEquity(const Candle& candle) {
    EquitySample sample;
    sample.timestamp = candle.timestamp;
    sample.price = candle.close;
    sample.cash = cash_;
    sample.portfolio_value = portfolioValue(candle.close);
    sample.open_positions = static_cast<int>(positions_.size());
    sample.pending_orders = static_cast<int>(pending_orders_.size());
    equity_curve_.push_back(sample);
}

void LadderEngine::placeOrder(int level, double limit_price) {
    pending_orders_[level] = limit_price;
}

} // namespace engine
} // namespace ladder
