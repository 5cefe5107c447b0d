#include "backtest/BacktestEngine.h"
#include "common/Logger.h"
#include <utility>

namespace wavetrail {
namespace backtest {

namespace {
risk::BarContext makeContext(const analytics::SeriesCache& cache, size_t t) {
    risk::BarContext ctx;
    ctx.index = t;
    ctx.bar = cache.bar(t);
    ctx.atr = cache.atr(t);
    ctx.median_atr = cache.medianAtr(t);
    return ctx;
}

void countTriggerOutcome(engine::RunAudit& audit, strategy::TriggerOutcome outcome) {
    switch (outcome) {
        case strategy::TriggerOutcome::NO_BREAKOUT: audit.no_breakout++; break;
        case strategy::TriggerOutcome::REGIME_MISALIGNED: audit.regime_misaligned++; break;
        case strategy::TriggerOutcome::DIRECTION_FILTERED: audit.direction_filtered++; break;
        case strategy::TriggerOutcome::ACTIONABLE: audit.triggers++; break;
    }
}

void countScheduleResult(engine::RunAudit& audit, execution::ScheduleResult result) {
    switch (result) {
        case execution::ScheduleResult::SCHEDULED: audit.entries_scheduled++; break;
        case execution::ScheduleResult::DROPPED_POSITION_OPEN: audit.dropped_position_open++; break;
        case execution::ScheduleResult::DROPPED_PENDING_ORDER: audit.dropped_pending_order++; break;
        case execution::ScheduleResult::DROPPED_COOLDOWN: audit.dropped_cooldown++; break;
        case execution::ScheduleResult::DROPPED_NO_DIRECTION: break;
    }
}
} // namespace

BacktestEngine::BacktestEngine(engine::SymbolConfig config)
    : config_(std::move(config)) {}

BacktestEngine::Result BacktestEngine::run(const std::vector<Bar>& raw_bars) const {
    Result result;
    result.symbol = config_.symbol;

    const analytics::SeriesCache cache = analytics::SeriesCache::build(config_.symbol, raw_bars, config_);
    result.warnings = cache.warnings();
    result.audit.bars_seen = static_cast<int>(cache.rawBarCount());
    result.audit.bars_skipped = static_cast<int>(cache.warnings().size());

    if (cache.empty()) {
        LOG_WARN("{}: no usable bars", config_.symbol);
        return result;
    }
    result.first_timestamp = cache.bar(0).timestamp;
    result.last_timestamp = cache.bar(cache.size() - 1).timestamp;

    const analytics::RegimeDetector regime_detector(config_.regime);
    analytics::EventWaveDetector wave_detector(config_.eventwave);
    const strategy::TriggerEvaluator trigger(config_.trigger, config_.entry);
    execution::EntryScheduler scheduler(config_.entry);
    risk::RiskManager risk_manager(config_.symbol, config_.risk);

    const size_t warmup = config_.warmup_bars > 0 ? static_cast<size_t>(config_.warmup_bars) : 0;
    auto& audit = result.audit;

    LOG_INFO("{}: replaying {} bars (warm-up {})", config_.symbol, cache.size(), warmup);

    for (size_t t = 0; t < cache.size(); ++t) {
        const risk::BarContext ctx = makeContext(cache, t);
        scheduler.tick();

        // 1. Market-on-open fill of the order scheduled on t-1
        execution::EntryFill fill;
        if (scheduler.takeFill(t, ctx.bar, fill)) {
            // Risk is sized from the last closed bar at fill time
            if (risk_manager.openPosition(fill, cache.atr(fill.signal_bar))) {
                audit.entries_filled++;
            } else {
                audit.entries_rejected++;
            }
        }

        // 2. Manage the open position on bar t
        bool exited = false;
        if (risk_manager.hasPosition()) {
            if (auto trade = risk_manager.onBar(ctx)) {
                result.trades.push_back(std::move(*trade));
                scheduler.armCooldown();
                exited = true;
            }
        }

        // 3. Signals from bar t; detectors see every bar to keep their state
        const analytics::WaveSignal wave = wave_detector.update(cache, t);
        if (t < warmup) {
            audit.warmup_bars++;
            continue;
        }
        audit.bars_evaluated++;

        if (!wave.release_fired) {
            continue;
        }
        audit.releases++;
        if (exited) {
            audit.releases_on_exit_bar++;
            continue;
        }

        const analytics::RegimeAnalysis regime = regime_detector.analyzeRegime(cache, t);
        const strategy::TriggerDecision decision = trigger.evaluate(cache, t, regime_detector, regime);
        countTriggerOutcome(audit, decision.outcome);
        if (!decision.actionable()) {
            continue;
        }

        const execution::ScheduleResult scheduled =
            scheduler.schedule(decision.direction, t, risk_manager.hasPosition());
        countScheduleResult(audit, scheduled);
    }

    // A signal on the last bar has no next open to fill at
    scheduler.expirePending();
    audit.entries_expired = scheduler.expiredCount();

    if (risk_manager.hasPosition()) {
        if (auto trade = risk_manager.closeAtEnd(makeContext(cache, cache.size() - 1))) {
            result.trades.push_back(std::move(*trade));
        }
    }

    LOG_INFO("{}: {} trades, {} releases, {} triggers, {} bars skipped",
             config_.symbol, result.trades.size(), audit.releases, audit.triggers, audit.bars_skipped);
    return result;
}

} // namespace backtest
} // namespace wavetrail
