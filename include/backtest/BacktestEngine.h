#pragma once

#include <string>
#include <vector>
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/PerformanceStore.h"
#include "analytics/SeriesCache.h"
#include "analytics/RegimeDetector.h"
#include "analytics/EventWaveDetector.h"
#include "strategy/TriggerEvaluator.h"
#include "execution/EntryScheduler.h"
#include "risk/RiskManager.h"

namespace wavetrail {
namespace backtest {

// Sequential replay of one symbol-month run.
//
// For every bar t: fill the order scheduled on t-1 at open[t], let the
// risk engine manage the open position on bar t, then feed bar t to the
// detectors. A release after warm-up is confirmed by the trigger and
// scheduled for t+1. Nothing computed for bar t reads bars after t.
class BacktestEngine {
public:
    explicit BacktestEngine(engine::SymbolConfig config);

    struct Result {
        std::string symbol;
        std::vector<risk::TradeRecord> trades;
        std::vector<BarWarning> warnings;
        engine::RunAudit audit;
        long long first_timestamp = 0;
        long long last_timestamp = 0;
    };

    // Throws StateInvariantViolation if the risk engine detects a contract failure.
    Result run(const std::vector<Bar>& raw_bars) const;

    const engine::SymbolConfig& config() const { return config_; }

private:
    engine::SymbolConfig config_;
};

} // namespace backtest
} // namespace wavetrail
