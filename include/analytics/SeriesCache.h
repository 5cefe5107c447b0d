#pragma once

#include <string>
#include <vector>
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace wavetrail {
namespace analytics {

// Validated bar sequence of one symbol-month run plus every rolling series
// the pipeline reads. Built once, read-only afterwards; each run owns its own.
class SeriesCache {
public:
    // Malformed and out-of-order bars are dropped and reported in warnings().
    static SeriesCache build(const std::string& symbol,
                             const std::vector<Bar>& raw_bars,
                             const engine::SymbolConfig& config);

    // Throws DataError describing why the bar cannot be used.
    // previous is the last accepted bar, or nullptr for the first one.
    static void validateBar(const Bar& bar, const Bar* previous);

    const std::string& symbol() const { return symbol_; }
    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    const std::vector<Bar>& bars() const { return bars_; }
    const Bar& bar(size_t i) const { return bars_[i]; }
    double close(size_t i) const { return bars_[i].close; }

    double atr(size_t i) const { return atr_[i]; }
    double medianAtr(size_t i) const { return median_atr_[i]; }
    double releaseZ(size_t i) const { return release_z_[i]; }
    double triggerZ(size_t i) const { return trigger_z_[i]; }
    double donchianHigh(size_t i) const { return donchian_high_[i]; }
    double donchianLow(size_t i) const { return donchian_low_[i]; }

    const std::vector<BarWarning>& warnings() const { return warnings_; }
    size_t rawBarCount() const { return raw_bar_count_; }

private:
    SeriesCache() = default;

    std::string symbol_;
    std::vector<Bar> bars_;
    std::vector<double> atr_;
    std::vector<double> median_atr_;
    std::vector<double> release_z_;
    std::vector<double> trigger_z_;
    std::vector<double> donchian_high_;
    std::vector<double> donchian_low_;
    std::vector<BarWarning> warnings_;
    size_t raw_bar_count_ = 0;
};

} // namespace analytics
} // namespace wavetrail
