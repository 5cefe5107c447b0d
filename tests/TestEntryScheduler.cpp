#include "execution/EntryScheduler.h"
#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace wavetrail;
using wavetrail::execution::EntryFill;
using wavetrail::execution::EntryScheduler;
using wavetrail::execution::ScheduleResult;

namespace {
Bar barAt(size_t t, double o, double h, double l, double c) {
    return Bar(static_cast<long long>(t) * 60000, o, h, l, c, 1.0);
}
}

int main() {
    engine::EntryParams params;

    {
        // Signal on bar 5 fills at the open of bar 6
        EntryScheduler scheduler(params);
        assert(scheduler.schedule(TrendDirection::UP, 5, false) == ScheduleResult::SCHEDULED);
        assert(scheduler.hasPending());

        EntryFill fill;
        assert(scheduler.takeFill(6, barAt(6, 101.5, 102.0, 100.0, 101.0), fill));
        assert(fill.side == PositionSide::LONG);
        assert(fill.signal_bar == 5);
        assert(fill.fill_bar == 6);
        assert(fill.price == 101.5);
        assert(fill.timestamp == 6 * 60000);
        assert(!scheduler.hasPending());
        assert(scheduler.filledCount() == 1);
    }

    {
        EntryScheduler scheduler(params);
        assert(scheduler.schedule(TrendDirection::DOWN, 3, false) == ScheduleResult::SCHEDULED);
        assert(scheduler.pending().side == PositionSide::SHORT);
        assert(scheduler.schedule(TrendDirection::UP, 3, false) == ScheduleResult::DROPPED_PENDING_ORDER);
        assert(scheduler.schedule(TrendDirection::FLAT, 3, false) == ScheduleResult::DROPPED_NO_DIRECTION);
    }

    {
        // A pending order that misses its bar expires instead of filling late
        EntryScheduler scheduler(params);
        scheduler.schedule(TrendDirection::UP, 10, false);
        EntryFill fill;
        assert(!scheduler.takeFill(12, barAt(12, 100, 101, 99, 100), fill));
        assert(!scheduler.hasPending());
        assert(scheduler.expiredCount() == 1);

        scheduler.schedule(TrendDirection::UP, 20, false);
        scheduler.expirePending();
        assert(scheduler.expiredCount() == 2);
    }

    {
        engine::EntryParams cooled;
        cooled.cooldown_bars = 2;
        EntryScheduler scheduler(cooled);
        scheduler.armCooldown();
        assert(scheduler.schedule(TrendDirection::UP, 1, false) == ScheduleResult::DROPPED_COOLDOWN);
        scheduler.tick();
        assert(scheduler.cooldownRemaining() == 1);
        assert(scheduler.schedule(TrendDirection::UP, 2, false) == ScheduleResult::DROPPED_COOLDOWN);
        scheduler.tick();
        assert(scheduler.schedule(TrendDirection::UP, 3, false) == ScheduleResult::SCHEDULED);
    }

    {
        // Triggers on consecutive bars while a position is open: one trade
        engine::RiskParams risk_params;
        risk_params.sl_atr_mult = 1.0;
        risk_params.be_enabled = false;
        risk_params.tsl_enabled = false;

        EntryScheduler scheduler(params);
        risk::RiskManager risk_manager("TEST", risk_params);
        std::vector<risk::TradeRecord> trades;

        const std::vector<Bar> bars = {
            barAt(5, 100.0, 101.0, 99.5, 100.5),
            barAt(6, 101.5, 102.0, 100.0, 101.0),
            barAt(7, 101.0, 101.5, 99.0, 100.0),
            barAt(8, 100.0, 100.0, 95.0, 96.0),
        };

        assert(scheduler.schedule(TrendDirection::UP, 5, risk_manager.hasPosition()) == ScheduleResult::SCHEDULED);
        for (size_t i = 1; i < bars.size(); ++i) {
            const size_t t = 5 + i;
            EntryFill fill;
            if (scheduler.takeFill(t, bars[i], fill)) {
                assert(risk_manager.openPosition(fill, 5.0));
            }

            risk::BarContext ctx;
            ctx.index = t;
            ctx.bar = bars[i];
            ctx.atr = 5.0;
            ctx.median_atr = 5.0;
            if (auto trade = risk_manager.onBar(ctx)) {
                trades.push_back(*trade);
                continue;
            }

            if (t == 6 || t == 7) {
                assert(scheduler.schedule(TrendDirection::UP, t, risk_manager.hasPosition()) ==
                       ScheduleResult::DROPPED_POSITION_OPEN);
            }
        }

        assert(trades.size() == 1);
        assert(trades[0].entry_bar == 6);
        assert(trades[0].entry_price == 101.5);
        assert(trades[0].exit_bar == 8);
        assert(trades[0].exit_reason == ExitReason::SL);
        assert(std::abs(trades[0].exit_price - 96.5) < 1e-12);
    }

    std::cout << "[TEST] EntryScheduler PASSED\n";
    return 0;
}
