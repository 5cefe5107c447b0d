#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace wavetrail {
namespace execution {

// Order scheduled on a signal bar, executed at the open of the next bar.
struct PendingEntry {
    PositionSide side = PositionSide::LONG;
    size_t signal_bar = 0;
};

struct EntryFill {
    PositionSide side = PositionSide::LONG;
    size_t signal_bar = 0;
    size_t fill_bar = 0;
    long long timestamp = 0;
    double price = 0.0;
};

enum class ScheduleResult {
    SCHEDULED,
    DROPPED_POSITION_OPEN,
    DROPPED_PENDING_ORDER,
    DROPPED_COOLDOWN,
    DROPPED_NO_DIRECTION
};

// Single pending entry order with a t -> t+1 fill contract and a bar cooldown.
class EntryScheduler {
public:
    explicit EntryScheduler(engine::EntryParams params);

    ScheduleResult schedule(TrendDirection direction, size_t signal_bar, bool position_open);

    // Fill at bar.open when the pending order was scheduled on t - 1.
    // Any other pending order expires. Returns false when nothing fills.
    bool takeFill(size_t t, const Bar& bar, EntryFill& fill);

    // Drop the pending order (end of data).
    void expirePending();

    // Once per bar, before any scheduling on that bar.
    void tick();
    void armCooldown();

    bool hasPending() const { return has_pending_; }
    const PendingEntry& pending() const { return pending_; }
    int cooldownRemaining() const { return cooldown_remaining_; }

    int scheduledCount() const { return scheduled_count_; }
    int filledCount() const { return filled_count_; }
    int expiredCount() const { return expired_count_; }

private:
    engine::EntryParams params_;
    PendingEntry pending_;
    bool has_pending_ = false;
    int cooldown_remaining_ = 0;

    int scheduled_count_ = 0;
    int filled_count_ = 0;
    int expired_count_ = 0;
};

inline const char* toString(ScheduleResult result) {
    switch (result) {
        case ScheduleResult::SCHEDULED: return "SCHEDULED";
        case ScheduleResult::DROPPED_POSITION_OPEN: return "DROPPED_POSITION_OPEN";
        case ScheduleResult::DROPPED_PENDING_ORDER: return "DROPPED_PENDING_ORDER";
        case ScheduleResult::DROPPED_COOLDOWN: return "DROPPED_COOLDOWN";
        case ScheduleResult::DROPPED_NO_DIRECTION: return "DROPPED_NO_DIRECTION";
    }
    return "DROPPED_NO_DIRECTION";
}

} // namespace execution
} // namespace wavetrail
