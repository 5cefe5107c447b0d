#include "execution/EntryScheduler.h"
#include "common/Logger.h"
#include <utility>

namespace wavetrail {
namespace execution {

EntryScheduler::EntryScheduler(engine::EntryParams params)
    : params_(std::move(params)) {}

ScheduleResult EntryScheduler::schedule(TrendDirection direction, size_t signal_bar, bool position_open) {
    if (direction == TrendDirection::FLAT) {
        return ScheduleResult::DROPPED_NO_DIRECTION;
    }
    if (position_open) {
        return ScheduleResult::DROPPED_POSITION_OPEN;
    }
    if (has_pending_) {
        return ScheduleResult::DROPPED_PENDING_ORDER;
    }
    if (cooldown_remaining_ > 0) {
        return ScheduleResult::DROPPED_COOLDOWN;
    }

    pending_.side = sideFromDirection(direction);
    pending_.signal_bar = signal_bar;
    has_pending_ = true;
    scheduled_count_++;

    LOG_DEBUG("entry {} scheduled at bar {} for bar {}",
              toString(pending_.side), signal_bar, signal_bar + 1);
    return ScheduleResult::SCHEDULED;
}

bool EntryScheduler::takeFill(size_t t, const Bar& bar, EntryFill& fill) {
    if (!has_pending_) {
        return false;
    }

    if (pending_.signal_bar + 1 != t) {
        LOG_DEBUG("entry scheduled at bar {} expired unfilled at bar {}", pending_.signal_bar, t);
        expirePending();
        return false;
    }

    fill.side = pending_.side;
    fill.signal_bar = pending_.signal_bar;
    fill.fill_bar = t;
    fill.timestamp = bar.timestamp;
    fill.price = bar.open;

    has_pending_ = false;
    filled_count_++;
    armCooldown();
    return true;
}

void EntryScheduler::expirePending() {
    if (has_pending_) {
        has_pending_ = false;
        expired_count_++;
    }
}

void EntryScheduler::tick() {
    if (cooldown_remaining_ > 0) {
        cooldown_remaining_--;
    }
}

void EntryScheduler::armCooldown() {
    cooldown_remaining_ = params_.cooldown_bars;
}

} // namespace execution
} // namespace wavetrail
