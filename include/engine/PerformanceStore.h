#pragma once

#include "risk/RiskManager.h"
#include <nlohmann/json.hpp>
#include <array>
#include <map>
#include <string>
#include <vector>

namespace wavetrail {
namespace engine {

// Bar and signal accounting of one run, from raw bars to filled entries
struct RunAudit {
    int bars_seen = 0;                  // rows handed to the series cache
    int bars_skipped = 0;               // malformed / out-of-order
    int warmup_bars = 0;                // evaluated bars inside the warm-up window
    int bars_evaluated = 0;

    int releases = 0;
    int releases_on_exit_bar = 0;
    int no_breakout = 0;
    int regime_misaligned = 0;
    int direction_filtered = 0;
    int triggers = 0;                   // actionable breakouts

    int dropped_position_open = 0;
    int dropped_pending_order = 0;
    int dropped_cooldown = 0;

    int entries_scheduled = 0;
    int entries_filled = 0;
    int entries_rejected = 0;           // non-positive initial risk
    int entries_expired = 0;

    nlohmann::json toJson() const;
};

struct RStats {
    int trades = 0;
    int wins = 0;
    double sum_r = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double averageR() const {
        return (trades > 0) ? (sum_r / static_cast<double>(trades)) : 0.0;
    }
};

struct OvershootStats {
    int count = 0;          // stop exits
    int nonzero = 0;        // stop exits that printed beyond the stop
    double sum_r = 0.0;
    double max_r = 0.0;

    double meanR() const {
        return (count > 0) ? (sum_r / static_cast<double>(count)) : 0.0;
    }
};

// R-multiple histogram: <-1, -1..-0.5, -0.5..0, 0..0.5, 0.5..1, 1..2, >=2
constexpr size_t R_BUCKET_COUNT = 7;
size_t rBucketIndex(double r_multiple);
const char* rBucketLabel(size_t index);

// Aggregate closed trades of one run into R-based statistics.
class PerformanceStore {
public:
    void rebuild(const std::vector<risk::TradeRecord>& trades, const RunAudit& audit);

    const RStats& total() const { return total_; }
    const std::map<ExitReason, RStats>& byExitReason() const { return by_exit_reason_; }
    RStats exitReason(ExitReason reason) const;
    const std::array<int, R_BUCKET_COUNT>& rBuckets() const { return r_buckets_; }
    const OvershootStats& overshoot() const { return overshoot_; }
    double medianR() const { return median_r_; }
    double profitFactorR() const;
    const RunAudit& audit() const { return audit_; }

    nlohmann::json toJson() const;

private:
    RStats total_;
    std::map<ExitReason, RStats> by_exit_reason_;
    std::array<int, R_BUCKET_COUNT> r_buckets_{};
    OvershootStats overshoot_;
    double median_r_ = 0.0;
    double gross_win_r_ = 0.0;
    double gross_loss_r_ = 0.0;
    RunAudit audit_;
};

} // namespace engine
} // namespace wavetrail
