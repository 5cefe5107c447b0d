#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "analytics/SeriesCache.h"
#include "analytics/RegimeDetector.h"

namespace wavetrail {
namespace strategy {

enum class TriggerOutcome {
    NO_BREAKOUT,
    REGIME_MISALIGNED,
    DIRECTION_FILTERED,
    ACTIONABLE
};

struct TriggerDecision {
    TriggerOutcome outcome = TriggerOutcome::NO_BREAKOUT;
    TrendDirection direction = TrendDirection::FLAT;
    double level = 0.0;          // channel edge or z-score that was crossed

    bool actionable() const { return outcome == TriggerOutcome::ACTIONABLE; }
};

// Breakout confirmation on a release bar.
class TriggerEvaluator {
public:
    TriggerEvaluator(engine::TriggerParams params, engine::EntryParams entry);

    // Raw breakout of close[t]: donchian compares against the channel of
    // the previous donchian_window bars, zscore against the threshold.
    TrendDirection breakout(const analytics::SeriesCache& cache, size_t t, double* level = nullptr) const;

    TriggerDecision evaluate(const analytics::SeriesCache& cache, size_t t,
                             const analytics::RegimeDetector& regime_detector,
                             const analytics::RegimeAnalysis& regime) const;

    bool directionAllowed(TrendDirection direction) const;

private:
    engine::TriggerParams params_;
    engine::EntryParams entry_;
};

inline const char* toString(TriggerOutcome outcome) {
    switch (outcome) {
        case TriggerOutcome::NO_BREAKOUT: return "NO_BREAKOUT";
        case TriggerOutcome::REGIME_MISALIGNED: return "REGIME_MISALIGNED";
        case TriggerOutcome::DIRECTION_FILTERED: return "DIRECTION_FILTERED";
        case TriggerOutcome::ACTIONABLE: return "ACTIONABLE";
    }
    return "NO_BREAKOUT";
}

} // namespace strategy
} // namespace wavetrail
