#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <deque>
#include <iterator>
#include <limits>
#include <set>

namespace wavetrail {
namespace analytics {

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();

bool windowIsFinite(const std::vector<double>& values, size_t end, int window) {
    for (size_t i = end + 1 - window; i <= end; ++i) {
        if (!std::isfinite(values[i])) return false;
    }
    return true;
}

double windowMean(const std::vector<double>& values, size_t end, int window) {
    double sum = 0.0;
    for (size_t i = end + 1 - window; i <= end; ++i) {
        sum += values[i];
    }
    return sum / window;
}

double windowStd(const std::vector<double>& values, size_t end, int window, double mean) {
    double sq = 0.0;
    for (size_t i = end + 1 - window; i <= end; ++i) {
        const double d = values[i] - mean;
        sq += d * d;
    }
    return std::sqrt(sq / window);
}

// Monotonic deque extreme; better(a, b) is true when a dominates b.
template<typename Better>
std::vector<double> rollingExtreme(const std::vector<double>& values, int window, Better better) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) return out;

    std::deque<size_t> dq;
    size_t last_nan = std::numeric_limits<size_t>::max();
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            last_nan = i;
            dq.clear();
            continue;
        }
        while (!dq.empty() && !better(values[dq.back()], values[i])) {
            dq.pop_back();
        }
        dq.push_back(i);
        while (dq.front() + window <= i) {
            dq.pop_front();
        }

        const bool full = i + 1 >= static_cast<size_t>(window);
        const bool nan_in_window = last_nan != std::numeric_limits<size_t>::max() &&
                                   last_nan + window > i;
        if (full && !nan_in_window) {
            out[i] = values[dq.front()];
        }
    }
    return out;
}
}

std::vector<double> TechnicalIndicators::calculateTrueRange(const std::vector<Bar>& bars) {
    std::vector<double> tr;
    tr.reserve(bars.size());

    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& current = bars[i];
        double tr1 = current.high - current.low;
        if (i == 0) {
            tr.push_back(tr1);
            continue;
        }
        const double prev_close = bars[i - 1].close;
        double tr2 = std::abs(current.high - prev_close);
        double tr3 = std::abs(current.low - prev_close);
        tr.push_back(std::max({tr1, tr2, tr3}));
    }
    return tr;
}

std::vector<double> TechnicalIndicators::calculateATRSeries(const std::vector<Bar>& bars,
                                                            int period,
                                                            engine::AtrMethod method) {
    if (bars.empty() || period <= 0) {
        return std::vector<double>(bars.size(), kNaN);
    }

    if (method == engine::AtrMethod::SMA) {
        std::vector<double> ranges;
        ranges.reserve(bars.size());
        for (const auto& bar : bars) {
            ranges.push_back(std::abs(bar.high - bar.low));
        }
        return rollingMean(ranges, period);
    }

    // Wilder's smoothing: atr = atr + (tr - atr) / period
    const auto tr = calculateTrueRange(bars);
    const double alpha = 1.0 / period;
    std::vector<double> atr(tr.size());
    atr[0] = tr[0];
    for (size_t i = 1; i < tr.size(); ++i) {
        atr[i] = (1.0 - alpha) * atr[i - 1] + alpha * tr[i];
    }
    return atr;
}

std::vector<double> TechnicalIndicators::rollingMean(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) return out;

    for (size_t i = static_cast<size_t>(window) - 1; i < values.size(); ++i) {
        if (!windowIsFinite(values, i, window)) continue;
        out[i] = windowMean(values, i, window);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingStd(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) return out;

    for (size_t i = static_cast<size_t>(window) - 1; i < values.size(); ++i) {
        if (!windowIsFinite(values, i, window)) continue;
        const double mean = windowMean(values, i, window);
        out[i] = windowStd(values, i, window, mean);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMedian(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) return out;

    // lo holds the smaller half (one extra element when odd), hi the larger half
    std::multiset<double> lo;
    std::multiset<double> hi;
    size_t nan_count = 0;

    auto rebalance = [&]() {
        while (lo.size() > hi.size() + 1) {
            auto it = std::prev(lo.end());
            hi.insert(*it);
            lo.erase(it);
        }
        while (hi.size() > lo.size()) {
            auto it = hi.begin();
            lo.insert(*it);
            hi.erase(it);
        }
    };

    auto insert = [&](double v) {
        if (!std::isfinite(v)) {
            ++nan_count;
            return;
        }
        if (lo.empty() || v <= *lo.rbegin()) {
            lo.insert(v);
        } else {
            hi.insert(v);
        }
        rebalance();
    };

    auto erase = [&](double v) {
        if (!std::isfinite(v)) {
            --nan_count;
            return;
        }
        if (!lo.empty() && v <= *lo.rbegin()) {
            lo.erase(lo.find(v));
        } else {
            hi.erase(hi.find(v));
        }
        rebalance();
    };

    for (size_t i = 0; i < values.size(); ++i) {
        insert(values[i]);
        if (i >= static_cast<size_t>(window)) {
            erase(values[i - window]);
        }
        if (i + 1 < static_cast<size_t>(window) || nan_count > 0) {
            continue;
        }
        if (window % 2 == 1) {
            out[i] = *lo.rbegin();
        } else {
            out[i] = (*lo.rbegin() + *hi.begin()) / 2.0;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingZScore(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) return out;

    for (size_t i = static_cast<size_t>(window) - 1; i < values.size(); ++i) {
        if (!windowIsFinite(values, i, window)) continue;
        const double mean = windowMean(values, i, window);
        const double sd = windowStd(values, i, window, mean);
        if (sd > 0.0) {
            out[i] = (values[i] - mean) / sd;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMax(const std::vector<double>& values, int window) {
    return rollingExtreme(values, window, [](double a, double b) { return a > b; });
}

std::vector<double> TechnicalIndicators::rollingMin(const std::vector<double>& values, int window) {
    return rollingExtreme(values, window, [](double a, double b) { return a < b; });
}

std::vector<double> TechnicalIndicators::calculateReturns(const std::vector<double>& closes) {
    std::vector<double> out(closes.size(), kNaN);
    for (size_t i = 1; i < closes.size(); ++i) {
        if (closes[i - 1] != 0.0) {
            out[i] = closes[i] / closes[i - 1] - 1.0;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractHighPrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.high);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractLowPrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.low);
    }
    return prices;
}

} // namespace analytics
} // namespace wavetrail
