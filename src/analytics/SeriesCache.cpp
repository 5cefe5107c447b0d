#include "analytics/SeriesCache.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <cmath>

namespace wavetrail {
namespace analytics {

void SeriesCache::validateBar(const Bar& bar, const Bar* previous) {
    if (!std::isfinite(bar.open) || !std::isfinite(bar.high) ||
        !std::isfinite(bar.low) || !std::isfinite(bar.close)) {
        throw DataError("non-finite OHLC");
    }
    if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
        throw DataError("invalid volume");
    }
    if (bar.high < bar.low) {
        throw DataError("high below low");
    }
    if (bar.open > bar.high || bar.open < bar.low ||
        bar.close > bar.high || bar.close < bar.low) {
        throw DataError("open/close outside high-low range");
    }
    if (previous != nullptr && bar.timestamp <= previous->timestamp) {
        throw DataError("non-monotonic timestamp");
    }
}

SeriesCache SeriesCache::build(const std::string& symbol,
                               const std::vector<Bar>& raw_bars,
                               const engine::SymbolConfig& config) {
    SeriesCache cache;
    cache.symbol_ = symbol;
    cache.raw_bar_count_ = raw_bars.size();
    cache.bars_.reserve(raw_bars.size());

    for (size_t row = 0; row < raw_bars.size(); ++row) {
        const Bar& bar = raw_bars[row];
        const Bar* previous = cache.bars_.empty() ? nullptr : &cache.bars_.back();
        try {
            validateBar(bar, previous);
            cache.bars_.push_back(bar);
        } catch (const DataError& e) {
            BarWarning warning;
            warning.symbol = symbol;
            warning.timestamp = bar.timestamp;
            warning.source_row = row;
            warning.reason = e.what();
            LOG_WARN("{} bar skipped (row {}, ts {}): {}", symbol, row, bar.timestamp, warning.reason);
            cache.warnings_.push_back(std::move(warning));
        }
    }

    const auto closes = TechnicalIndicators::extractClosePrices(cache.bars_);

    cache.atr_ = TechnicalIndicators::calculateATRSeries(cache.bars_, config.atr_window, config.atr_method);
    cache.median_atr_ = TechnicalIndicators::rollingMedian(cache.atr_, config.eventwave.median_window);

    if (config.eventwave.source == engine::ReleaseSource::RETURN) {
        const auto returns = TechnicalIndicators::calculateReturns(closes);
        cache.release_z_ = TechnicalIndicators::rollingZScore(returns, config.eventwave.zscore_window);
    } else {
        cache.release_z_ = TechnicalIndicators::rollingZScore(closes, config.eventwave.zscore_window);
    }

    cache.trigger_z_ = TechnicalIndicators::rollingZScore(closes, config.trigger.zscore_window);
    cache.donchian_high_ = TechnicalIndicators::rollingMax(
        TechnicalIndicators::extractHighPrices(cache.bars_), config.trigger.donchian_window);
    cache.donchian_low_ = TechnicalIndicators::rollingMin(
        TechnicalIndicators::extractLowPrices(cache.bars_), config.trigger.donchian_window);

    LOG_DEBUG("{} series cache built: {} bars ({} skipped)", symbol, cache.bars_.size(), cache.warnings_.size());
    return cache;
}

} // namespace analytics
} // namespace wavetrail
