#include "analytics/RegimeDetector.h"
#include <cmath>
#include <utility>

namespace wavetrail {
namespace analytics {

RegimeDetector::RegimeDetector(engine::RegimeParams params)
    : params_(std::move(params)) {}

TrendDirection RegimeDetector::direction(const SeriesCache& cache, size_t t, int lookback) const {
    if (lookback <= 0 || t >= cache.size() || t < static_cast<size_t>(lookback)) {
        return TrendDirection::FLAT;
    }

    const double base = cache.close(t - lookback);
    const double change = cache.close(t) - base;
    const double neutral_band = params_.neutral_zone_pct * std::abs(base);

    if (std::abs(change) <= neutral_band) {
        return TrendDirection::FLAT;
    }
    return change > 0.0 ? TrendDirection::UP : TrendDirection::DOWN;
}

RegimeAnalysis RegimeDetector::analyzeRegime(const SeriesCache& cache, size_t t) const {
    RegimeAnalysis result;
    result.directions.reserve(params_.lookbacks.size());

    for (int lookback : params_.lookbacks) {
        const TrendDirection d = direction(cache, t, lookback);
        result.directions.push_back(d);
        if (d == TrendDirection::UP) {
            result.up_votes++;
        } else if (d == TrendDirection::DOWN) {
            result.down_votes++;
        }
    }

    // Bearish majority wins when both sides reach the quorum
    if (result.down_votes >= params_.require_majority) {
        result.regime = TrendDirection::DOWN;
    } else if (result.up_votes >= params_.require_majority) {
        result.regime = TrendDirection::UP;
    } else {
        result.regime = TrendDirection::FLAT;
    }
    return result;
}

bool RegimeDetector::isAligned(const RegimeAnalysis& analysis, TrendDirection breakout) const {
    switch (breakout) {
        case TrendDirection::UP:
            return analysis.up_votes >= params_.require_majority;
        case TrendDirection::DOWN:
            return analysis.down_votes >= params_.require_majority;
        case TrendDirection::FLAT:
            return false;
    }
    return false;
}

} // namespace analytics
} // namespace wavetrail
