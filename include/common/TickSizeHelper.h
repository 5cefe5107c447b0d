#pragma once
// ===================================================================
// Stop price quantization
//
// Exchanges accept stop prices only on multiples of the symbol's tick.
// Stops are rounded toward the less favourable tick: down for a long
// stop, up for a short stop. A tick of 0 disables quantization.
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

#include "common/Types.h"

namespace wavetrail {
namespace common {

// Tolerance in tick units; absorbs binary representation error so that
// a price already on the grid is not pushed one tick away.
constexpr double kTickEpsilon = 1e-9;

inline bool isTickEnabled(double tick) {
    return std::isfinite(tick) && tick > 0.0;
}

inline double roundDownToTick(double price, double tick) {
    if (!isTickEnabled(tick)) return price;
    return std::floor(price / tick + kTickEpsilon) * tick;
}

inline double roundUpToTick(double price, double tick) {
    if (!isTickEnabled(tick)) return price;
    return std::ceil(price / tick - kTickEpsilon) * tick;
}

// Long stops round down, short stops round up.
inline double quantizeStop(double price, double tick, PositionSide side) {
    return side == PositionSide::LONG ? roundDownToTick(price, tick)
                                      : roundUpToTick(price, tick);
}

inline bool isOnTick(double price, double tick) {
    if (!isTickEnabled(tick)) return true;
    const double units = price / tick;
    return std::fabs(units - std::round(units)) < 1e-6;
}

// Decimal places needed to print prices of this tick exactly
inline int tickDecimals(double tick) {
    if (!isTickEnabled(tick)) return 8;
    int decimals = 0;
    double t = tick;
    while (std::fabs(t - std::round(t)) > kTickEpsilon && decimals < 8) {
        t *= 10.0;
        decimals++;
    }
    return decimals;
}

inline std::string priceToString(double price, double tick) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", tickDecimals(tick), price);
    return std::string(buf);
}

} // namespace common
} // namespace wavetrail
