#include "analytics/EventWaveDetector.h"
#include "common/Logger.h"
#include <cmath>
#include <limits>
#include <utility>

namespace wavetrail {
namespace analytics {

EventWaveDetector::EventWaveDetector(engine::EventWaveParams params)
    : params_(std::move(params)) {}

void EventWaveDetector::reset() {
    state_ = WaveState::QUIET;
    state_since_ = 0;
    has_squeeze_end_ = false;
    last_squeeze_end_ = 0;
    release_count_ = 0;
}

void EventWaveDetector::transition(WaveState next, size_t t) {
    LOG_DEBUG("eventwave {} -> {} at bar {}", toString(state_), toString(next), t);
    state_ = next;
    state_since_ = t;
}

WaveSignal EventWaveDetector::update(const SeriesCache& cache, size_t t) {
    return update(t, cache.atr(t), cache.medianAtr(t), cache.releaseZ(t));
}

WaveSignal EventWaveDetector::update(size_t t, double atr, double median_atr, double release_z) {
    WaveSignal signal;

    const bool baseline_ready = std::isfinite(atr) && std::isfinite(median_atr) && median_atr > 0.0;
    signal.atr_ratio = baseline_ready ? atr / median_atr : std::numeric_limits<double>::quiet_NaN();
    const bool compressed = baseline_ready && atr < params_.pct_of_median * median_atr;

    const bool ignition = std::isfinite(release_z) && std::abs(release_z) > params_.zscore_threshold;
    const TrendDirection ignition_direction = !ignition ? TrendDirection::FLAT
        : (release_z > 0.0 ? TrendDirection::UP : TrendDirection::DOWN);

    auto fire = [&]() {
        transition(WaveState::RELEASE, t);
        has_squeeze_end_ = false;
        release_count_++;
        signal.release_fired = true;
        signal.release_direction = ignition_direction;
    };

    switch (state_) {
        case WaveState::QUIET: {
            const bool in_grace = has_squeeze_end_ &&
                                  t - last_squeeze_end_ <= static_cast<size_t>(params_.grace_bars);
            if (in_grace && ignition) {
                fire();
            } else if (compressed) {
                transition(WaveState::SQUEEZE, t);
            } else if (has_squeeze_end_ && !in_grace) {
                has_squeeze_end_ = false;
            }
            break;
        }
        case WaveState::SQUEEZE:
            if (ignition) {
                fire();
            } else if (!compressed) {
                transition(WaveState::QUIET, t);
                has_squeeze_end_ = true;
                last_squeeze_end_ = t;
            }
            break;
        case WaveState::RELEASE:
            if (!compressed) {
                transition(WaveState::QUIET, t);
            }
            break;
    }

    signal.state = state_;
    return signal;
}

} // namespace analytics
} // namespace wavetrail
