#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "execution/EntryScheduler.h"
#include <optional>
#include <string>
#include <vector>

namespace wavetrail {
namespace risk {

// One recorded stop move
struct StopMove {
    size_t bar_index;
    long long timestamp;
    double stop;
    StopSource source;
    double trail_distance;      // 0 for breakeven moves
    double floor_distance;      // floor_from_med_mult * median_atr at the time of the move
};

// Open position state
struct Position {
    PositionSide side;
    double entry_price;
    size_t entry_bar_index;
    long long entry_timestamp;
    double atr_at_entry;

    // Initial risk
    double initial_stop;
    double initial_r;
    double take_profit;         // 0 when the target is disabled

    // Stop management
    double current_stop;
    StopSource stop_source;
    bool breakeven_armed;
    TslState tsl_state;
    size_t last_step_bar_index;
    long long last_step_timestamp;
    int step_count;
    double extreme_price;       // highest high (long) / lowest low (short) since entry

    std::vector<StopMove> stop_history;

    Position()
        : side(PositionSide::LONG), entry_price(0), entry_bar_index(0)
        , entry_timestamp(0), atr_at_entry(0)
        , initial_stop(0), initial_r(0), take_profit(0)
        , current_stop(0), stop_source(StopSource::INITIAL)
        , breakeven_armed(false), tsl_state(TslState::INACTIVE)
        , step_count(0), extreme_price(0)
    {}

    // Full state dump for invariant violations
    std::string describe() const;
};

// Closed position
struct TradeRecord {
    std::string symbol;
    PositionSide side;
    size_t entry_bar;
    size_t exit_bar;
    long long entry_timestamp;
    long long exit_timestamp;
    double entry_price;
    double exit_price;
    double initial_stop;
    double final_stop;
    double take_profit;
    ExitReason exit_reason;
    double r_multiple;
    double overshoot_r;
    int step_count;

    TradeRecord()
        : side(PositionSide::LONG), entry_bar(0), exit_bar(0)
        , entry_timestamp(0), exit_timestamp(0)
        , entry_price(0), exit_price(0), initial_stop(0), final_stop(0)
        , take_profit(0), exit_reason(ExitReason::CLOSE)
        , r_multiple(0), overshoot_r(0), step_count(0)
    {}
};

// Closed bar plus the series values the risk engine reads for it
struct BarContext {
    size_t index = 0;
    Bar bar;
    double atr = 0.0;
    double median_atr = 0.0;
};

// Risk Engine - lifecycle of the single open position
//
// Per bar: exit check against the stop/target in force at the start of
// the bar, then breakeven promotion, TSL arming and TSL stepping from the
// bar's close. The stop never loosens and the TSL state only moves forward.
class RiskManager {
public:
    RiskManager(std::string symbol, engine::RiskParams params);

    // ===== Position lifecycle =====

    // Initial stop/target from atr_at_entry. Returns false (entry rejected)
    // when the initial risk is not positive. Throws StateInvariantViolation
    // if a position is already open.
    bool openPosition(const execution::EntryFill& fill, double atr_at_entry);

    // Must be called once per bar from the fill bar onwards.
    std::optional<TradeRecord> onBar(const BarContext& ctx);

    // Mark-to-close of a position still open after the last bar
    std::optional<TradeRecord> closeAtEnd(const BarContext& ctx);

    bool hasPosition() const { return position_.has_value(); }
    const Position& position() const;

    // ===== Stop calculation =====

    double trailDistance(double atr, double median_atr) const;
    double floorDistance(double median_atr) const;

    int rejectedEntries() const { return rejected_entries_; }
    const std::string& symbol() const { return symbol_; }
    const engine::RiskParams& params() const { return params_; }

private:
    std::optional<TradeRecord> checkExit(const BarContext& ctx);
    void checkBreakeven(const BarContext& ctx);
    void checkTslArming(const BarContext& ctx);
    void maybeStepTrailing(const BarContext& ctx);

    void moveStop(double new_stop, StopSource source, const BarContext& ctx,
                  double trail_distance, double floor_distance);
    void advanceTslState(TslState next);
    bool isMoreFavorable(double candidate, double reference) const;
    double quantize(double price) const;

    TradeRecord closePosition(const BarContext& ctx, double exit_price,
                              ExitReason reason, double overshoot_r);

    void violation(const std::string& message) const;

    std::string symbol_;
    engine::RiskParams params_;
    std::optional<Position> position_;
    int rejected_entries_ = 0;
};

} // namespace risk
} // namespace wavetrail
