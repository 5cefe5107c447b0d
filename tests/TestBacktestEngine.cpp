#include "backtest/BacktestEngine.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace wavetrail;
using wavetrail::backtest::BacktestEngine;

namespace {
constexpr long long MINUTE_MS = 60000;

Bar barAt(size_t t, double o, double h, double l, double c) {
    return Bar(static_cast<long long>(t) * MINUTE_MS, o, h, l, c, 10.0);
}

// 50 volatile bars, 30 compressed bars, a breakout on bar 80, a slow
// grind up, a crash through the stop on bar 90 and a flat tail.
std::vector<Bar> squeezeBreakoutSeries() {
    std::vector<Bar> bars;
    for (size_t t = 0; t < 50; ++t) {
        bars.push_back(barAt(t, 100.0, 101.0, 99.0, 100.0));
    }
    for (size_t t = 50; t < 80; ++t) {
        bars.push_back(barAt(t, 100.0, 100.05, 99.95, 100.0));
    }
    bars.push_back(barAt(80, 100.0, 103.2, 100.0, 103.0));
    bars.push_back(barAt(81, 103.1, 103.5, 102.8, 103.3));

    double close = 103.3;
    for (size_t t = 82; t < 90; ++t) {
        const double open = close;
        close += 0.1;
        bars.push_back(barAt(t, open, close + 0.1, open - 0.1, close));
    }
    bars.push_back(barAt(90, close, close, 98.0, 98.5));
    for (size_t t = 91; t < 96; ++t) {
        bars.push_back(barAt(t, 98.5, 98.55, 98.45, 98.5));
    }
    return bars;
}

engine::SymbolConfig testConfig() {
    engine::SymbolConfig config;
    config.symbol = "SYNTH";
    config.warmup_bars = 40;
    config.atr_window = 5;
    config.atr_method = engine::AtrMethod::WILDER;
    config.regime.lookbacks = {30};
    config.regime.require_majority = 1;
    config.eventwave.pct_of_median = 0.8;
    config.eventwave.median_window = 30;
    config.eventwave.zscore_window = 10;
    config.eventwave.zscore_threshold = 2.0;
    config.eventwave.grace_bars = 5;
    config.trigger.mode = engine::TriggerMode::DONCHIAN;
    config.trigger.donchian_window = 10;
    config.entry.direction = engine::EntryDirection::LONG_ONLY;
    config.entry.cooldown_bars = 0;
    config.risk.sl_atr_mult = 1.0;
    config.risk.tp_atr_mult = 0.0;
    config.risk.be_enabled = false;
    config.risk.tsl_enabled = false;
    return config;
}

bool sameTrades(const std::vector<risk::TradeRecord>& a, const std::vector<risk::TradeRecord>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].side != b[i].side || a[i].entry_bar != b[i].entry_bar ||
            a[i].exit_bar != b[i].exit_bar || a[i].entry_timestamp != b[i].entry_timestamp ||
            a[i].exit_timestamp != b[i].exit_timestamp || a[i].entry_price != b[i].entry_price ||
            a[i].exit_price != b[i].exit_price || a[i].final_stop != b[i].final_stop ||
            a[i].exit_reason != b[i].exit_reason || a[i].r_multiple != b[i].r_multiple ||
            a[i].overshoot_r != b[i].overshoot_r || a[i].step_count != b[i].step_count) {
            return false;
        }
    }
    return true;
}
}

int main() {
    const std::vector<Bar> bars = squeezeBreakoutSeries();
    const BacktestEngine backtester(testConfig());

    {
        const auto result = backtester.run(bars);
        assert(result.symbol == "SYNTH");
        assert(result.warnings.empty());
        assert(result.audit.bars_seen == static_cast<int>(bars.size()));
        assert(result.audit.warmup_bars == 40);
        assert(result.audit.releases >= 1);
        assert(result.audit.triggers >= 1);
        assert(result.audit.entries_filled == 1);

        assert(result.trades.size() == 1);
        const auto& trade = result.trades.front();
        assert(trade.side == PositionSide::LONG);
        // Signal on the breakout bar, fill at the next open
        assert(trade.entry_bar == 81);
        assert(trade.entry_price == bars[81].open);
        assert(trade.entry_timestamp == bars[81].timestamp);
        assert(trade.exit_bar == 90);
        assert(trade.exit_reason == ExitReason::SL);
        assert(std::abs(trade.r_multiple + 1.0) < 1e-9);
        assert(trade.overshoot_r > 0.0);
    }

    {
        // Identical input replays to identical records
        const auto first = backtester.run(bars);
        const auto second = backtester.run(bars);
        assert(sameTrades(first.trades, second.trades));
    }

    {
        // Malformed and out-of-order bars are skipped with a warning
        std::vector<Bar> dirty = bars;
        Bar nan_bar = bars[60];
        nan_bar.timestamp += 30000;
        nan_bar.close = std::nan("");
        Bar stale_bar = bars[70];
        stale_bar.timestamp = bars[65].timestamp;
        dirty.insert(dirty.begin() + 71, stale_bar);
        dirty.insert(dirty.begin() + 61, nan_bar);

        const auto result = backtester.run(dirty);
        assert(result.warnings.size() == 2);
        assert(result.audit.bars_skipped == 2);
        assert(result.warnings[0].reason == "non-finite OHLC");
        assert(result.warnings[1].reason == "non-monotonic timestamp");
        assert(sameTrades(result.trades, backtester.run(bars).trades));
    }

    {
        // A breakout on the last bar has no next open and expires
        const std::vector<Bar> truncated(bars.begin(), bars.begin() + 81);
        const auto result = backtester.run(truncated);
        assert(result.trades.empty());
        assert(result.audit.entries_scheduled == 1);
        assert(result.audit.entries_expired == 1);
    }

    {
        // Warm-up longer than the data suppresses every signal
        engine::SymbolConfig config = testConfig();
        config.warmup_bars = 500;
        const auto result = BacktestEngine(config).run(bars);
        assert(result.trades.empty());
        assert(result.audit.releases == 0);
    }

    {
        // Position still open after the last bar is marked to the close
        const std::vector<Bar> open_ended(bars.begin(), bars.begin() + 90);
        const auto result = backtester.run(open_ended);
        assert(result.trades.size() == 1);
        assert(result.trades[0].exit_reason == ExitReason::CLOSE);
        assert(result.trades[0].exit_price == open_ended.back().close);
    }

    {
        const auto result = backtester.run({});
        assert(result.trades.empty());
        assert(result.audit.bars_seen == 0);
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
