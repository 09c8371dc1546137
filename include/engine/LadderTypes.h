#pragma once

#include "common/Types.h"

namespace ladder {
namespace engine {

struct LadderPosition {
    long long id = 0;
    int level = 0;
    Price entry_price = 0.0;       // quoted limit, not the touched bar price
    Volume size = 0.0;             // allocation / entry_price
    Price sell_target = 0.0;       // entry_price * (1 + sell_pct)
    TimestampMs opened_at = 0;
};

struct TradeRecord {
    OrderSide side = OrderSide::BUY;
    int level = 0;
    long long position_id = 0;
    TimestampMs timestamp = 0;
    Price price = 0.0;
    Volume size = 0.0;
    Amount cash_delta = 0.0;       // consumed on BUY, received on SELL (both positive)
    Price entry_price = 0.0;       // SELL only
    Amount realized_pnl = 0.0;     // SELL only

    bool isSell() const { return side == OrderSide::SELL; }
};

struct EquitySample {
    TimestampMs timestamp = 0;
    Amount portfolio_value = 0.0;
    Price price = 0.0;
    int open_positions = 0;
    int pending_orders = 0;
    Amount cash = 0.0;
};

} // namespace engine
} // namespace ladder
