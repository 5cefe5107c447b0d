#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace wavetrail {

using Price = double;
using Volume = double;

// timestamp is epoch milliseconds
struct Bar {
    long long timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(long long t, double o, double h, double l, double c, double v)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

enum class TrendDirection { FLAT, UP, DOWN };
enum class PositionSide { LONG, SHORT };
enum class WaveState { QUIET, SQUEEZE, RELEASE };
enum class TslState { INACTIVE, ARMED_PENDING_DELAY, ACTIVE };
enum class StopSource { INITIAL, BREAKEVEN, TRAILING };
enum class ExitReason { SL, BE, TSL, TP, CLOSE };

// Skipped-bar diagnostic
struct BarWarning {
    std::string symbol;
    long long timestamp = 0;
    std::size_t source_row = 0;
    std::string reason;
};

inline int sideSign(PositionSide side) {
    return side == PositionSide::LONG ? 1 : -1;
}

inline PositionSide sideFromDirection(TrendDirection direction) {
    return direction == TrendDirection::DOWN ? PositionSide::SHORT : PositionSide::LONG;
}

inline const char* toString(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::FLAT: return "FLAT";
        case TrendDirection::UP: return "UP";
        case TrendDirection::DOWN: return "DOWN";
    }
    return "FLAT";
}

inline const char* toString(PositionSide side) {
    switch (side) {
        case PositionSide::LONG: return "LONG";
        case PositionSide::SHORT: return "SHORT";
    }
    return "LONG";
}

inline const char* toString(WaveState state) {
    switch (state) {
        case WaveState::QUIET: return "QUIET";
        case WaveState::SQUEEZE: return "SQUEEZE";
        case WaveState::RELEASE: return "RELEASE";
    }
    return "QUIET";
}

inline const char* toString(TslState state) {
    switch (state) {
        case TslState::INACTIVE: return "INACTIVE";
        case TslState::ARMED_PENDING_DELAY: return "ARMED_PENDING_DELAY";
        case TslState::ACTIVE: return "ACTIVE";
    }
    return "INACTIVE";
}

inline const char* toString(StopSource source) {
    switch (source) {
        case StopSource::INITIAL: return "INITIAL";
        case StopSource::BREAKEVEN: return "BREAKEVEN";
        case StopSource::TRAILING: return "TRAILING";
    }
    return "INITIAL";
}

inline const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::SL: return "SL";
        case ExitReason::BE: return "BE";
        case ExitReason::TSL: return "TSL";
        case ExitReason::TP: return "TP";
        case ExitReason::CLOSE: return "CLOSE";
    }
    return "CLOSE";
}

} // namespace wavetrail
