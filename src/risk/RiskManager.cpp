#include "risk/RiskManager.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace wavetrail {
namespace risk {

namespace {
// Comparison slack for prices that went through quantization
constexpr double PRICE_EPSILON = 1e-12;

ExitReason exitReasonFor(StopSource source) {
    switch (source) {
        case StopSource::INITIAL: return ExitReason::SL;
        case StopSource::BREAKEVEN: return ExitReason::BE;
        case StopSource::TRAILING: return ExitReason::TSL;
    }
    return ExitReason::SL;
}

int tslRank(TslState state) {
    switch (state) {
        case TslState::INACTIVE: return 0;
        case TslState::ARMED_PENDING_DELAY: return 1;
        case TslState::ACTIVE: return 2;
    }
    return 0;
}
} // namespace

std::string Position::describe() const {
    std::ostringstream oss;
    oss << std::setprecision(10)
        << "Position{side=" << toString(side)
        << " entry_price=" << entry_price
        << " entry_bar=" << entry_bar_index
        << " entry_ts=" << entry_timestamp
        << " atr_at_entry=" << atr_at_entry
        << " initial_stop=" << initial_stop
        << " initial_r=" << initial_r
        << " take_profit=" << take_profit
        << " current_stop=" << current_stop
        << " stop_source=" << toString(stop_source)
        << " breakeven_armed=" << (breakeven_armed ? "true" : "false")
        << " tsl_state=" << toString(tsl_state)
        << " last_step_bar=" << last_step_bar_index
        << " last_step_ts=" << last_step_timestamp
        << " step_count=" << step_count
        << " extreme=" << extreme_price
        << " stop_moves=" << stop_history.size()
        << "}";
    return oss.str();
}

RiskManager::RiskManager(std::string symbol, engine::RiskParams params)
    : symbol_(std::move(symbol)), params_(std::move(params)) {}

const Position& RiskManager::position() const {
    if (!position_) {
        throw StateInvariantViolation(symbol_ + ": no open position");
    }
    return *position_;
}

void RiskManager::violation(const std::string& message) const {
    const std::string dump = position_ ? position_->describe() : std::string("Position{none}");
    LOG_ERROR("{} risk invariant violated: {} | {}", symbol_, message, dump);
    throw StateInvariantViolation(symbol_ + ": " + message + " | " + dump);
}

double RiskManager::quantize(double price) const {
    return common::quantizeStop(price, params_.quantize_tick_size, position_->side);
}

bool RiskManager::isMoreFavorable(double candidate, double reference) const {
    return sideSign(position_->side) * (candidate - reference) > PRICE_EPSILON;
}

double RiskManager::floorDistance(double median_atr) const {
    if (!std::isfinite(median_atr) || median_atr <= 0.0) {
        return 0.0;
    }
    return params_.floor_from_med_mult * median_atr;
}

double RiskManager::trailDistance(double atr, double median_atr) const {
    return std::max(params_.tsl_atr_mult * atr, floorDistance(median_atr));
}

// ===== Position lifecycle =====

bool RiskManager::openPosition(const execution::EntryFill& fill, double atr_at_entry) {
    if (position_) {
        violation("second position opened at bar " + std::to_string(fill.fill_bar));
    }

    Position pos;
    pos.side = fill.side;
    pos.entry_price = fill.price;
    pos.entry_bar_index = fill.fill_bar;
    pos.entry_timestamp = fill.timestamp;
    pos.atr_at_entry = atr_at_entry;

    const int sign = sideSign(fill.side);
    const double raw_stop = fill.price - sign * params_.sl_atr_mult * atr_at_entry;
    pos.initial_stop = common::quantizeStop(raw_stop, params_.quantize_tick_size, fill.side);
    pos.initial_r = std::abs(fill.price - pos.initial_stop);

    if (!std::isfinite(pos.initial_r) || pos.initial_r <= 0.0) {
        rejected_entries_++;
        LOG_WARN("{} entry rejected at bar {}: initial risk {} (atr {})",
                 symbol_, fill.fill_bar, pos.initial_r, atr_at_entry);
        return false;
    }

    if (params_.tp_atr_mult > 0.0) {
        pos.take_profit = fill.price + sign * params_.tp_atr_mult * atr_at_entry;
    }

    pos.current_stop = pos.initial_stop;
    pos.stop_source = StopSource::INITIAL;
    pos.extreme_price = fill.price;
    pos.last_step_bar_index = fill.fill_bar;
    pos.last_step_timestamp = fill.timestamp;

    position_ = pos;

    LOG_INFO("{} {} entry @ {:.8f} bar {} | stop {:.8f} (R {:.8f}) target {:.8f}",
             symbol_, toString(pos.side), pos.entry_price, pos.entry_bar_index,
             pos.initial_stop, pos.initial_r, pos.take_profit);
    return true;
}

std::optional<TradeRecord> RiskManager::onBar(const BarContext& ctx) {
    if (!position_) {
        return std::nullopt;
    }
    if (ctx.index < position_->entry_bar_index) {
        violation("bar " + std::to_string(ctx.index) + " precedes entry bar");
    }

    if (auto exit = checkExit(ctx)) {
        return exit;
    }

    Position& pos = *position_;
    if (pos.side == PositionSide::LONG) {
        pos.extreme_price = std::max(pos.extreme_price, ctx.bar.high);
    } else {
        pos.extreme_price = std::min(pos.extreme_price, ctx.bar.low);
    }

    checkBreakeven(ctx);
    checkTslArming(ctx);
    maybeStepTrailing(ctx);
    return std::nullopt;
}

std::optional<TradeRecord> RiskManager::closeAtEnd(const BarContext& ctx) {
    if (!position_) {
        return std::nullopt;
    }
    return closePosition(ctx, ctx.bar.close, ExitReason::CLOSE, 0.0);
}

// ===== Per-bar steps =====

std::optional<TradeRecord> RiskManager::checkExit(const BarContext& ctx) {
    const Position& pos = *position_;
    const Bar& bar = ctx.bar;

    // Stop first: the adverse side is assumed to print before the target
    const bool stop_touched = pos.side == PositionSide::LONG
        ? bar.low <= pos.current_stop
        : bar.high >= pos.current_stop;
    if (stop_touched) {
        const double adverse = pos.side == PositionSide::LONG
            ? pos.current_stop - bar.low
            : bar.high - pos.current_stop;
        const double overshoot_r = std::max(0.0, adverse) / pos.initial_r;
        return closePosition(ctx, pos.current_stop, exitReasonFor(pos.stop_source), overshoot_r);
    }

    if (params_.tp_atr_mult > 0.0) {
        const bool target_touched = pos.side == PositionSide::LONG
            ? bar.high >= pos.take_profit
            : bar.low <= pos.take_profit;
        if (target_touched) {
            return closePosition(ctx, pos.take_profit, ExitReason::TP, 0.0);
        }
    }
    return std::nullopt;
}

void RiskManager::checkBreakeven(const BarContext& ctx) {
    Position& pos = *position_;
    if (!params_.be_enabled || pos.breakeven_armed) {
        return;
    }

    const int sign = sideSign(pos.side);
    const double favorable = (ctx.bar.close - pos.entry_price) * sign;
    if (favorable < params_.be_threshold_r * pos.initial_r) {
        return;
    }

    // Armed only by an actual move; a stop already past breakeven keeps its source
    const double target = quantize(pos.entry_price + sign * params_.be_buffer_r * pos.initial_r);
    if (isMoreFavorable(target, pos.current_stop)) {
        moveStop(target, StopSource::BREAKEVEN, ctx, 0.0, floorDistance(ctx.median_atr));
        pos.breakeven_armed = true;
        LOG_INFO("{} stop moved to breakeven {:.8f} at bar {}", symbol_, target, ctx.index);
    }
}

void RiskManager::checkTslArming(const BarContext& ctx) {
    Position& pos = *position_;
    if (!params_.tsl_enabled || pos.tsl_state != TslState::INACTIVE) {
        return;
    }

    const long long elapsed_secs = (ctx.bar.timestamp - pos.entry_timestamp) / 1000;
    if (elapsed_secs >= params_.first_step_delay_secs) {
        advanceTslState(TslState::ARMED_PENDING_DELAY);
        LOG_DEBUG("{} TSL armed at bar {} ({}s after entry)", symbol_, ctx.index, elapsed_secs);
    }
}

void RiskManager::maybeStepTrailing(const BarContext& ctx) {
    Position& pos = *position_;
    if (pos.tsl_state == TslState::INACTIVE) {
        return;
    }
    if (!std::isfinite(ctx.atr) || ctx.atr <= 0.0) {
        return;
    }

    // Debounce, measured from the entry until the first stop move
    const long long since_last_secs = (ctx.bar.timestamp - pos.last_step_timestamp) / 1000;
    if (since_last_secs < params_.min_step_secs) {
        return;
    }

    const int sign = sideSign(pos.side);

    // Minimum advance beyond the stop
    const double advance = (ctx.bar.close - pos.current_stop) * sign;
    if (advance < params_.step_atr_mult * ctx.atr) {
        return;
    }

    const double floor = floorDistance(ctx.median_atr);
    const double trail = trailDistance(ctx.atr, ctx.median_atr);
    const double candidate = quantize(pos.extreme_price - sign * trail);

    if (!isMoreFavorable(candidate, pos.current_stop)) {
        return;
    }

    moveStop(candidate, StopSource::TRAILING, ctx, trail, floor);
    if (pos.tsl_state != TslState::ACTIVE) {
        advanceTslState(TslState::ACTIVE);
    }
    pos.step_count++;

    LOG_DEBUG("{} TSL step #{} at bar {}: stop {:.8f} (trail {:.8f}, floor {:.8f})",
              symbol_, pos.step_count, ctx.index, candidate, trail, floor);
}

// ===== Guarded mutations =====

void RiskManager::moveStop(double new_stop, StopSource source, const BarContext& ctx,
                           double trail_distance, double floor_distance) {
    Position& pos = *position_;
    if (!std::isfinite(new_stop)) {
        violation("non-finite stop " + std::to_string(new_stop));
    }
    if (sideSign(pos.side) * (new_stop - pos.current_stop) < -PRICE_EPSILON) {
        violation("stop would loosen from " + std::to_string(pos.current_stop) +
                  " to " + std::to_string(new_stop));
    }

    pos.current_stop = new_stop;
    pos.stop_source = source;
    pos.last_step_bar_index = ctx.index;
    pos.last_step_timestamp = ctx.bar.timestamp;
    pos.stop_history.push_back(StopMove{ctx.index, ctx.bar.timestamp, new_stop, source,
                                        trail_distance, floor_distance});
}

void RiskManager::advanceTslState(TslState next) {
    Position& pos = *position_;
    if (tslRank(next) < tslRank(pos.tsl_state)) {
        violation(std::string("TSL state moved backwards from ") + toString(pos.tsl_state) +
                  " to " + toString(next));
    }
    pos.tsl_state = next;
}

TradeRecord RiskManager::closePosition(const BarContext& ctx, double exit_price,
                                       ExitReason reason, double overshoot_r) {
    const Position& pos = *position_;

    TradeRecord trade;
    trade.symbol = symbol_;
    trade.side = pos.side;
    trade.entry_bar = pos.entry_bar_index;
    trade.exit_bar = ctx.index;
    trade.entry_timestamp = pos.entry_timestamp;
    trade.exit_timestamp = ctx.bar.timestamp;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.initial_stop = pos.initial_stop;
    trade.final_stop = pos.current_stop;
    trade.take_profit = pos.take_profit;
    trade.exit_reason = reason;
    trade.r_multiple = (exit_price - pos.entry_price) * sideSign(pos.side) / pos.initial_r;
    trade.overshoot_r = overshoot_r;
    trade.step_count = pos.step_count;

    position_.reset();

    LOG_INFO("{} {} exit @ {:.8f} bar {} | {} R={:.4f} overshoot={:.4f}",
             symbol_, toString(trade.side), trade.exit_price, trade.exit_bar,
             toString(trade.exit_reason), trade.r_multiple, trade.overshoot_r);
    Logger::getInstance().logTrade(symbol_, toString(trade.side), trade.entry_price,
                                   trade.exit_price, toString(trade.exit_reason),
                                   trade.r_multiple);
    return trade;
}

} // namespace risk
} // namespace wavetrail
