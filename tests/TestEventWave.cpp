#include "analytics/EventWaveDetector.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace wavetrail;
using wavetrail::analytics::EventWaveDetector;

int main() {
    engine::EventWaveParams params;
    params.pct_of_median = 0.8;
    params.zscore_threshold = 2.0;
    params.grace_bars = 3;

    EventWaveDetector wave(params);
    const double nan = std::nan("");

    {
        // Baseline not ready
        auto s = wave.update(0, 1.0, nan, nan);
        assert(s.state == WaveState::QUIET);
        assert(!s.release_fired);
        assert(std::isnan(s.atr_ratio));

        s = wave.update(1, 1.0, 1.0, 0.0);
        assert(s.state == WaveState::QUIET);
        assert(std::abs(s.atr_ratio - 1.0) < 1e-12);
    }

    {
        // Squeeze, then ignition fires exactly once
        auto s = wave.update(2, 0.5, 1.0, 0.0);
        assert(s.state == WaveState::SQUEEZE);
        assert(wave.stateSince() == 2);

        s = wave.update(3, 0.5, 1.0, 1.0);
        assert(s.state == WaveState::SQUEEZE && !s.release_fired);

        s = wave.update(4, 0.5, 1.0, 2.5);
        assert(s.state == WaveState::RELEASE);
        assert(s.release_fired);
        assert(s.release_direction == TrendDirection::UP);

        // Still compressed: stays in RELEASE without firing again
        s = wave.update(5, 0.5, 1.0, 3.0);
        assert(s.state == WaveState::RELEASE && !s.release_fired);

        s = wave.update(6, 1.0, 1.0, 0.0);
        assert(s.state == WaveState::QUIET && !s.release_fired);

        // Ignition without a preceding squeeze is ignored
        s = wave.update(7, 1.0, 1.0, 3.0);
        assert(s.state == WaveState::QUIET && !s.release_fired);
    }

    {
        // Ignition inside the grace window after the squeeze ends
        auto s = wave.update(8, 0.5, 1.0, 0.0);
        assert(s.state == WaveState::SQUEEZE);
        s = wave.update(9, 1.0, 1.0, 0.0);
        assert(s.state == WaveState::QUIET);
        s = wave.update(10, 1.0, 1.0, 0.5);
        assert(!s.release_fired);
        s = wave.update(11, 1.0, 1.0, -2.5);
        assert(s.release_fired);
        assert(s.release_direction == TrendDirection::DOWN);
        s = wave.update(12, 1.0, 1.0, 0.0);
        assert(s.state == WaveState::QUIET);
    }

    {
        // Grace window expired
        wave.update(13, 0.5, 1.0, 0.0);
        wave.update(14, 1.0, 1.0, 0.0);
        for (size_t t = 15; t < 18; ++t) {
            assert(!wave.update(t, 1.0, 1.0, 0.0).release_fired);
        }
        auto s = wave.update(18, 1.0, 1.0, 3.0);
        assert(!s.release_fired);
        assert(s.state == WaveState::QUIET);
    }

    assert(wave.releaseCount() == 2);

    wave.reset();
    assert(wave.state() == WaveState::QUIET);
    assert(wave.releaseCount() == 0);

    std::cout << "[TEST] EventWave PASSED\n";
    return 0;
}
