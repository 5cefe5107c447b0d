#include "strategy/TriggerEvaluator.h"
#include "common/Logger.h"
#include <cmath>
#include <utility>

namespace wavetrail {
namespace strategy {

TriggerEvaluator::TriggerEvaluator(engine::TriggerParams params, engine::EntryParams entry)
    : params_(std::move(params)), entry_(std::move(entry)) {}

TrendDirection TriggerEvaluator::breakout(const analytics::SeriesCache& cache, size_t t, double* level) const {
    if (t >= cache.size()) {
        return TrendDirection::FLAT;
    }

    const double close = cache.close(t);

    if (params_.mode == engine::TriggerMode::ZSCORE) {
        const double z = cache.triggerZ(t);
        if (!std::isfinite(z)) {
            return TrendDirection::FLAT;
        }
        if (level) *level = z;
        if (z > params_.zscore_threshold) return TrendDirection::UP;
        if (z < -params_.zscore_threshold) return TrendDirection::DOWN;
        return TrendDirection::FLAT;
    }

    // Channel excludes the breakout bar itself
    if (t == 0) {
        return TrendDirection::FLAT;
    }
    const double upper = cache.donchianHigh(t - 1);
    const double lower = cache.donchianLow(t - 1);
    if (!std::isfinite(upper) || !std::isfinite(lower)) {
        return TrendDirection::FLAT;
    }

    if (close > upper) {
        if (level) *level = upper;
        return TrendDirection::UP;
    }
    if (close < lower) {
        if (level) *level = lower;
        return TrendDirection::DOWN;
    }
    return TrendDirection::FLAT;
}

bool TriggerEvaluator::directionAllowed(TrendDirection direction) const {
    switch (entry_.direction) {
        case engine::EntryDirection::BOTH:
            return direction != TrendDirection::FLAT;
        case engine::EntryDirection::LONG_ONLY:
            return direction == TrendDirection::UP;
        case engine::EntryDirection::SHORT_ONLY:
            return direction == TrendDirection::DOWN;
    }
    return false;
}

TriggerDecision TriggerEvaluator::evaluate(const analytics::SeriesCache& cache, size_t t,
                                           const analytics::RegimeDetector& regime_detector,
                                           const analytics::RegimeAnalysis& regime) const {
    TriggerDecision decision;
    decision.direction = breakout(cache, t, &decision.level);

    if (decision.direction == TrendDirection::FLAT) {
        decision.outcome = TriggerOutcome::NO_BREAKOUT;
    } else if (!regime_detector.isAligned(regime, decision.direction)) {
        decision.outcome = TriggerOutcome::REGIME_MISALIGNED;
    } else if (!directionAllowed(decision.direction)) {
        decision.outcome = TriggerOutcome::DIRECTION_FILTERED;
    } else {
        decision.outcome = TriggerOutcome::ACTIONABLE;
    }

    LOG_DEBUG("{} trigger at bar {}: {} {} (level {:.6f})",
              cache.symbol(), t, toString(decision.direction),
              toString(decision.outcome), decision.level);
    return decision;
}

} // namespace strategy
} // namespace wavetrail
