#pragma once

#include <vector>
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace wavetrail {
namespace analytics {

// Rolling indicator series over a chronological bar sequence.
// Every function returns one value per input element; positions without
// a full window hold NaN. Sums are always accumulated oldest-first so
// results are reproducible bit for bit.
class TechnicalIndicators {
public:
    // True range; the first bar has no previous close and uses high - low.
    static std::vector<double> calculateTrueRange(const std::vector<Bar>& bars);

    // ATR series. WILDER: exponential smoothing with alpha = 1/period seeded
    // with the first true range. SMA: simple mean of (high - low) over period.
    static std::vector<double> calculateATRSeries(const std::vector<Bar>& bars,
                                                  int period,
                                                  engine::AtrMethod method = engine::AtrMethod::WILDER);

    static std::vector<double> rollingMean(const std::vector<double>& values, int window);

    // Population standard deviation (ddof = 0)
    static std::vector<double> rollingStd(const std::vector<double>& values, int window);

    static std::vector<double> rollingMedian(const std::vector<double>& values, int window);

    // (x - mean) / std over the trailing window including x. NaN when std is 0.
    static std::vector<double> rollingZScore(const std::vector<double>& values, int window);

    static std::vector<double> rollingMax(const std::vector<double>& values, int window);
    static std::vector<double> rollingMin(const std::vector<double>& values, int window);

    // close[i] / close[i-1] - 1, NaN for the first bar
    static std::vector<double> calculateReturns(const std::vector<double>& closes);

    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);
    static std::vector<double> extractHighPrices(const std::vector<Bar>& bars);
    static std::vector<double> extractLowPrices(const std::vector<Bar>& bars);
};

} // namespace analytics
} // namespace wavetrail
