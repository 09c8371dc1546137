#include "engine/LadderEngine.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include <vector>

using ladder::Candle;
using ladder::OrderSide;
using namespace ladder::engine;

namespace {
constexpr long long DAY = 86400000LL;
constexpr long long T0 = 1704067200000LL; // 2024-01-01

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

Candle bar(int day, double open, double high, double low, double close) {
    return Candle(open, high, low, close, 0.0, T0 + day * DAY);
}

Candle flat(int day, double price) {
    return bar(day, price, price, price, price);
}

LadderConfig singleLevel(double buy_pct, double sell_pct, double allocation) {
    LadderConfig config;
    config.levels = makeLevels({buy_pct}, {sell_pct}, {allocation});
    return config;
}

template <typename Fn>
bool throwsConfigError(Fn fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

template <typename Fn>
bool throwsDataError(Fn fn) {
    try {
        fn();
    } catch (const DataError&) {
        return true;
    }
    return false;
}
}

int main() {
    // Quote, fill at the exact limit, sell at the target
    {
        LadderEngine engine(singleLevel(0.04, 0.03, 1000.0));
        assert(near(engine.initialCash(), 1000.0));

        engine.step(flat(0, 700.0));
        assert(engine.pendingOrders().size() == 1);
        const double limit = engine.pendingOrders().at(0);
        assert(near(limit, 672.0));
        assert(near(engine.highWatermark(), 700.0));
        assert(engine.tradeLog().empty());

        // low touches the limit exactly
        engine.step(bar(1, 690.0, 700.0, limit, 680.0));
        assert(engine.openPositions().size() == 1);
        assert(engine.pendingOrders().empty());
        const LadderPosition pos = engine.openPositions().front();
        assert(pos.entry_price == limit);
        assert(near(pos.size, 1000.0 / limit));
        assert(near(pos.sell_target, 692.16));
        assert(near(engine.cash(), 0.0));
        assert(engine.tradeLog().size() == 1);
        assert(engine.tradeLog()[0].side == OrderSide::BUY);
        assert(engine.tradeLog()[0].price == limit);
        assert(near(engine.tradeLog()[0].cash_delta, 1000.0));

        // valuation uses the close, not the fill price
        const auto& sample = engine.equityCurve().back();
        assert(near(sample.portfolio_value, pos.size * 680.0));
        assert(sample.open_positions == 1);
        assert(sample.pending_orders == 0);

        engine.step(bar(2, 685.0, pos.sell_target, 684.0, 690.0));
        assert(engine.openPositions().empty());
        assert(engine.tradeLog().size() == 2);
        const TradeRecord& sell = engine.tradeLog()[1];
        assert(sell.side == OrderSide::SELL);
        assert(sell.price == pos.sell_target);
        assert(near(sell.cash_delta, pos.size * pos.sell_target));
        assert(near(sell.realized_pnl, 1000.0 * 0.03, 1e-6));
        assert(near(engine.cash(), pos.size * pos.sell_target));
        // re-quoted off the close
        assert(near(engine.pendingOrders().at(0), 690.0 * 0.96));
    }

    // Low one tick above the limit does not fill
    {
        LadderEngine engine(singleLevel(0.04, 0.03, 1000.0));
        engine.step(flat(0, 700.0));
        const double limit = engine.pendingOrders().at(0);
        engine.step(bar(1, 690.0, 700.0, limit + 0.01, 680.0));
        assert(engine.openPositions().empty());
        assert(engine.pendingOrders().count(0) == 1);
    }

    // Rising series never buys; value stays at initial cash
    {
        LadderConfig config = defaultLadderConfig();
        LadderEngine engine(config);
        std::vector<Candle> series;
        for (int i = 0; i < 60; ++i) {
            const double c = 100.0 + i;
            series.push_back(bar(i, c - 0.2, c + 0.5, c - 0.5, c));
        }
        engine.run(series);
        assert(engine.tradeLog().empty());
        assert(engine.equityCurve().size() == series.size());
        for (const auto& s : engine.equityCurve()) {
            assert(s.portfolio_value == engine.initialCash());
            assert(s.cash == engine.initialCash());
            assert(s.open_positions == 0);
        }
        // watermark followed the trend and re-anchored level 0
        assert(engine.highWatermark() > 150.0);
        assert(near(engine.pendingOrders().at(0), engine.highWatermark() * (1.0 - config.levels[0].buy_pct)));
    }

    // Seeding policies
    {
        LadderConfig config;
        config.levels = makeLevels({0.1, 0.1, 0.1}, {0.05, 0.05, 0.05}, {100.0, 100.0, 100.0});

        config.seeding = SeedingPolicy::INDEPENDENT;
        LadderEngine independent(config);
        independent.initialize(flat(0, 100.0));
        assert(near(independent.pendingOrders().at(0), 90.0));
        assert(near(independent.pendingOrders().at(1), 90.0));
        assert(near(independent.pendingOrders().at(2), 90.0));

        config.seeding = SeedingPolicy::CASCADE;
        LadderEngine cascade(config);
        cascade.initialize(flat(0, 100.0));
        assert(near(cascade.pendingOrders().at(0), 90.0));
        assert(near(cascade.pendingOrders().at(1), 81.0));
        assert(near(cascade.pendingOrders().at(2), 72.9));
    }

    // Watermark re-anchor: threshold, watermark vs bar close source
    {
        LadderConfig config = singleLevel(0.04, 0.03, 100.0);
        config.reanchor_threshold_pct = 0.025;

        LadderEngine engine(config);
        engine.step(flat(0, 100.0));
        engine.step(bar(1, 100.0, 102.0, 100.0, 101.0));
        assert(near(engine.highWatermark(), 100.0));
        assert(near(engine.pendingOrders().at(0), 96.0));

        engine.step(bar(2, 101.0, 103.0, 100.0, 102.0));
        assert(near(engine.highWatermark(), 103.0));
        assert(near(engine.pendingOrders().at(0), 103.0 * 0.96));

        config.reanchor_source = ReanchorSource::BAR_CLOSE;
        LadderEngine by_close(config);
        by_close.step(flat(0, 100.0));
        by_close.step(bar(1, 101.0, 103.0, 100.0, 102.0));
        assert(near(by_close.highWatermark(), 103.0));
        assert(near(by_close.pendingOrders().at(0), 102.0 * 0.96));

        // Close-only mode ignores the high for the watermark
        config.reanchor_source = ReanchorSource::WATERMARK;
        config.trigger_mode = TriggerMode::CLOSE_ONLY;
        LadderEngine close_only(config);
        close_only.step(flat(0, 100.0));
        close_only.step(bar(1, 101.0, 110.0, 100.0, 102.0));
        assert(near(close_only.highWatermark(), 100.0));
        close_only.step(bar(2, 102.0, 104.0, 102.0, 103.0));
        assert(near(close_only.highWatermark(), 103.0));
    }

    // Close-only mode triggers on the close, high/low mode on the low
    {
        LadderConfig config = singleLevel(0.04, 0.03, 100.0);
        config.trigger_mode = TriggerMode::CLOSE_ONLY;
        LadderEngine close_only(config);
        close_only.step(flat(0, 100.0));
        close_only.step(bar(1, 99.0, 99.5, 90.0, 98.0));
        assert(close_only.openPositions().empty());
        close_only.step(bar(2, 97.0, 97.5, 95.0, 95.5));
        assert(close_only.openPositions().size() == 1);
        assert(near(close_only.openPositions().front().entry_price, 96.0));

        config.trigger_mode = TriggerMode::HIGH_LOW;
        LadderEngine high_low(config);
        high_low.step(flat(0, 100.0));
        high_low.step(bar(1, 99.0, 99.5, 90.0, 98.0));
        assert(high_low.openPositions().size() == 1);
        assert(near(high_low.openPositions().front().entry_price, 96.0));
    }

    // Fill places the next level off the fill price; no second fill in the same bar
    {
        LadderConfig config;
        config.levels = makeLevels({0.04, 0.04}, {0.03, 0.03}, {100.0, 100.0});
        LadderEngine engine(config);
        engine.step(flat(0, 100.0));
        engine.step(bar(1, 99.0, 99.0, 50.0, 60.0));
        assert(engine.tradeLog().size() == 1);
        assert(engine.openPositions().size() == 1);
        assert(engine.openPositions().front().level == 0);
        assert(engine.pendingOrders().count(0) == 0);
        assert(near(engine.pendingOrders().at(1), 96.0 * 0.96));

        engine.step(bar(2, 60.0, 61.0, 50.0, 60.0));
        assert(engine.tradeLog().size() == 2);
        assert(engine.openPositions().back().level == 1);
        assert(near(engine.openPositions().back().entry_price, 96.0 * 0.96));
        // last level places nothing deeper
        assert(engine.pendingOrders().empty());
        assert(near(engine.cash(), 0.0));
    }

    // Distinct next_buy_pct
    {
        LadderConfig config;
        config.levels = makeLevels({0.04, 0.05}, {0.03, 0.03}, {100.0, 100.0}, {0.10, 0.10});
        LadderEngine engine(config);
        engine.step(flat(0, 100.0));
        assert(near(engine.pendingOrders().at(1), 95.0));
        const double limit = engine.pendingOrders().at(0);
        engine.step(bar(1, 99.0, 99.0, limit, 97.0));
        assert(engine.openPositions().size() == 1);
        assert(near(engine.pendingOrders().at(1), 96.0 * 0.90));
    }

    // Insufficient cash defers the fill and keeps the quote
    {
        LadderConfig config;
        config.levels = makeLevels({0.04, 0.04}, {0.5, 0.5}, {100.0, 100.0});
        config.starting_capital = 150.0;
        LadderEngine engine(config);
        engine.step(flat(0, 100.0));
        engine.step(bar(1, 95.0, 95.0, 90.0, 91.0));
        assert(engine.openPositions().size() == 1);
        assert(near(engine.cash(), 50.0));

        const double deferred = engine.pendingOrders().at(1);
        engine.step(bar(2, 91.0, 91.0, 80.0, 85.0));
        engine.step(bar(3, 85.0, 86.0, 79.0, 84.0));
        assert(engine.openPositions().size() == 1);
        assert(engine.pendingOrders().at(1) == deferred);
        assert(engine.cash() >= 0.0);
        for (const auto& s : engine.equityCurve()) {
            assert(s.cash >= 0.0);
        }
    }

    // Sells run before buys within a bar
    {
        LadderEngine engine(singleLevel(0.04, 0.03, 100.0));
        engine.step(flat(0, 100.0));
        engine.step(bar(1, 97.0, 97.0, 95.5, 96.5));
        assert(engine.openPositions().size() == 1);
        assert(near(engine.cash(), 0.0));

        // high reaches the target, close drops, low crosses the fresh re-quote
        engine.step(bar(2, 97.0, 99.0, 90.0, 95.0));
        assert(engine.tradeLog().size() == 3);
        assert(engine.tradeLog()[1].side == OrderSide::SELL);
        assert(engine.tradeLog()[2].side == OrderSide::BUY);
        assert(near(engine.tradeLog()[2].price, 95.0 * 0.96));
        assert(engine.openPositions().size() == 1);
    }

    // Invariants over a long oscillating series, driven bar by bar
    {
        LadderConfig config = defaultLadderConfig();
        config.seeding = SeedingPolicy::CASCADE;
        LadderEngine engine(config);

        double price = 1000.0;
        for (int i = 0; i < 500; ++i) {
            const double wave = 120.0 * std::sin(i / 9.0) + 60.0 * std::sin(i / 2.3);
            const double close = price + wave;
            const Candle c = bar(i, close - 3.0, close + 8.0, close - 9.0, close);
            engine.step(c);
            price += (i % 100 < 50) ? -1.5 : 1.8;

            const auto& sample = engine.equityCurve().back();
            assert(sample.cash >= 0.0);
            assert(sample.cash == engine.cash());

            double expected = engine.cash();
            for (const auto& p : engine.openPositions()) {
                expected += p.size * c.close;
            }
            assert(sample.portfolio_value == expected);
            assert(engine.pendingOrders().size() <= config.levels.size());

            std::set<long long> ids;
            for (const auto& p : engine.openPositions()) {
                assert(ids.insert(p.id).second);
                assert(p.level >= 0 && p.level < static_cast<int>(config.levels.size()));
            }
        }

        assert(!engine.tradeLog().empty());
        assert(LadderEngine::replayCash(engine.initialCash(), engine.tradeLog()) == engine.cash());

        int buys = 0;
        int sells = 0;
        for (const auto& t : engine.tradeLog()) {
            if (t.isSell()) {
                ++sells;
                assert(t.realized_pnl > 0.0);
            } else {
                ++buys;
            }
        }
        assert(buys - sells == static_cast<int>(engine.openPositions().size()));
    }

    // Configuration errors surface at construction
    {
        assert(throwsConfigError([] { LadderEngine e{LadderConfig{}}; }));
        assert(throwsConfigError([] { makeLevels({0.04, 0.05}, {0.03}, {100.0, 100.0}); }));
        assert(throwsConfigError([] { LadderEngine e{singleLevel(0.04, 0.03, 0.0)}; }));
        assert(throwsConfigError([] { LadderEngine e{singleLevel(1.2, 0.03, 100.0)}; }));
        assert(throwsConfigError([] { LadderEngine e{singleLevel(0.04, -0.01, 100.0)}; }));
        assert(throwsConfigError([] {
            LadderConfig c = singleLevel(0.04, 0.03, 100.0);
            c.levels[0].index = 3;
            LadderEngine e{c};
        }));
        assert(throwsConfigError([] {
            LadderConfig c = singleLevel(0.04, 0.03, 100.0);
            c.reanchor_threshold_pct = 0.0;
            LadderEngine e{c};
        }));
        assert(throwsConfigError([] { seedingPolicyFromString("spiral"); }));
    }

    // Input errors are rejected before simulation
    {
        LadderEngine engine(singleLevel(0.04, 0.03, 100.0));
        assert(throwsDataError([&] { engine.run({}); }));
        assert(throwsDataError([&] { engine.run({flat(1, 100.0), flat(0, 100.0)}); }));
        assert(throwsDataError([&] { engine.run({flat(0, 100.0), flat(0, 101.0)}); }));
        assert(throwsDataError([&] { engine.run({flat(0, 100.0), bar(1, 100.0, 90.0, 95.0, 92.0)}); }));
        assert(engine.equityCurve().empty());

        engine.step(flat(5, 100.0));
        assert(throwsDataError([&] { engine.step(flat(4, 100.0)); }));
        assert(engine.equityCurve().size() == 1);
    }

    // A rejected first bar leaves the engine untouched
    {
        LadderConfig config;
        config.levels = makeLevels({0.04, 0.06}, {0.03, 0.04}, {100.0, 150.0});
        LadderEngine engine(config);
        assert(throwsDataError([&] { engine.step(Candle(0.0, 0.0, 0.0, std::nan(""), 0.0, 1000)); }));
        assert(!engine.isInitialized());
        assert(engine.pendingOrders().empty());
        assert(engine.equityCurve().empty());

        assert(throwsDataError([&] { engine.step(Candle(100.0, 0.0, 0.0, 0.0, 0.0, 1000)); }));
        assert(throwsDataError([&] { engine.step(bar(0, 100.0, 90.0, 95.0, 92.0)); }));
        assert(!engine.isInitialized());
        assert(engine.pendingOrders().empty());

        // The next valid bar seeds from its own close
        engine.step(bar(0, 100.0, 102.0, 99.0, 100.0));
        assert(engine.isInitialized());
        assert(near(engine.highWatermark(), 100.0));
        assert(engine.pendingOrders().size() == 2);
        assert(near(engine.pendingOrders().at(0), 96.0));
        assert(near(engine.pendingOrders().at(1), 94.0));
        assert(engine.tradeLog().empty());
        assert(engine.equityCurve().size() == 1);
    }

    std::cout << "[TEST] LadderEngine PASSED\n";
    return 0;
}
