#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "analytics/SeriesCache.h"

namespace wavetrail {
namespace analytics {

struct WaveSignal {
    WaveState state = WaveState::QUIET;
    bool release_fired = false;                         // true only on the bar that entered RELEASE
    TrendDirection release_direction = TrendDirection::FLAT;
    double atr_ratio = 0.0;                             // atr / median_atr, NaN while the baseline warms up
};

// Volatility squeeze / release detector.
//
//   QUIET   -> SQUEEZE  atr < pct_of_median * median_atr
//   SQUEEZE -> RELEASE  |z| > zscore_threshold (fires)
//   SQUEEZE -> QUIET    compression ends without ignition, grace window opens
//   QUIET   -> RELEASE  ignition within grace_bars of the squeeze end (fires)
//   RELEASE -> QUIET    compression ends
//
// A release fires at most once; the detector must return to QUIET before
// it can fire again. update() must be called for every bar in order.
class EventWaveDetector {
public:
    explicit EventWaveDetector(engine::EventWaveParams params);

    WaveSignal update(const SeriesCache& cache, size_t t);
    WaveSignal update(size_t t, double atr, double median_atr, double release_z);

    void reset();

    WaveState state() const { return state_; }
    size_t stateSince() const { return state_since_; }
    size_t releaseCount() const { return release_count_; }

private:
    void transition(WaveState next, size_t t);

    engine::EventWaveParams params_;
    WaveState state_ = WaveState::QUIET;
    size_t state_since_ = 0;
    bool has_squeeze_end_ = false;
    size_t last_squeeze_end_ = 0;
    size_t release_count_ = 0;
};

} // namespace analytics
} // namespace wavetrail
