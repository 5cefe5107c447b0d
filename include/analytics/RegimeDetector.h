#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "analytics/SeriesCache.h"
#include <vector>

namespace wavetrail {
namespace analytics {

struct RegimeAnalysis {
    std::vector<TrendDirection> directions;   // one per configured lookback
    int up_votes = 0;
    int down_votes = 0;
    TrendDirection regime = TrendDirection::FLAT;
};

// Time-series momentum regime: each lookback window votes on the sign of
// close[t] - close[t - lookback]. Pure function of the series cache.
class RegimeDetector {
public:
    explicit RegimeDetector(engine::RegimeParams params);

    // FLAT when fewer than lookback bars precede t or the change lies
    // inside the neutral zone.
    TrendDirection direction(const SeriesCache& cache, size_t t, int lookback) const;

    RegimeAnalysis analyzeRegime(const SeriesCache& cache, size_t t) const;

    // At least require_majority windows point in the breakout direction.
    bool isAligned(const RegimeAnalysis& analysis, TrendDirection breakout) const;

private:
    engine::RegimeParams params_;
};

} // namespace analytics
} // namespace wavetrail
