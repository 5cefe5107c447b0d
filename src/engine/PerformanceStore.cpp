#include "engine/PerformanceStore.h"

#include <algorithm>
#include <cmath>

namespace wavetrail {
namespace engine {
namespace {
bool isStopExit(ExitReason reason) {
    switch (reason) {
        case ExitReason::SL:
        case ExitReason::BE:
        case ExitReason::TSL:
            return true;
        case ExitReason::TP:
        case ExitReason::CLOSE:
            return false;
    }
    return false;
}

void accumulateStats(RStats& s, const risk::TradeRecord& trade) {
    s.trades++;
    s.sum_r += trade.r_multiple;
    if (trade.r_multiple > 0.0) {
        s.wins++;
    }
}
}

size_t rBucketIndex(double r_multiple) {
    if (r_multiple < -1.0) return 0;
    if (r_multiple < -0.5) return 1;
    if (r_multiple < 0.0) return 2;
    if (r_multiple < 0.5) return 3;
    if (r_multiple < 1.0) return 4;
    if (r_multiple < 2.0) return 5;
    return 6;
}

const char* rBucketLabel(size_t index) {
    static const char* labels[R_BUCKET_COUNT] = {
        "<-1", "-1..-0.5", "-0.5..0", "0..0.5", "0.5..1", "1..2", ">=2"
    };
    return index < R_BUCKET_COUNT ? labels[index] : "?";
}

nlohmann::json RunAudit::toJson() const {
    return {
        {"bars_seen", bars_seen},
        {"bars_skipped", bars_skipped},
        {"warmup_bars", warmup_bars},
        {"bars_evaluated", bars_evaluated},
        {"releases", releases},
        {"releases_on_exit_bar", releases_on_exit_bar},
        {"no_breakout", no_breakout},
        {"regime_misaligned", regime_misaligned},
        {"direction_filtered", direction_filtered},
        {"triggers", triggers},
        {"dropped_position_open", dropped_position_open},
        {"dropped_pending_order", dropped_pending_order},
        {"dropped_cooldown", dropped_cooldown},
        {"entries_scheduled", entries_scheduled},
        {"entries_filled", entries_filled},
        {"entries_rejected", entries_rejected},
        {"entries_expired", entries_expired}
    };
}

void PerformanceStore::rebuild(const std::vector<risk::TradeRecord>& trades, const RunAudit& audit) {
    total_ = RStats{};
    by_exit_reason_.clear();
    r_buckets_.fill(0);
    overshoot_ = OvershootStats{};
    median_r_ = 0.0;
    gross_win_r_ = 0.0;
    gross_loss_r_ = 0.0;
    audit_ = audit;

    std::vector<double> r_values;
    r_values.reserve(trades.size());

    for (const auto& trade : trades) {
        accumulateStats(total_, trade);
        accumulateStats(by_exit_reason_[trade.exit_reason], trade);
        r_buckets_[rBucketIndex(trade.r_multiple)]++;
        r_values.push_back(trade.r_multiple);

        if (trade.r_multiple > 0.0) {
            gross_win_r_ += trade.r_multiple;
        } else if (trade.r_multiple < 0.0) {
            gross_loss_r_ += std::abs(trade.r_multiple);
        }

        if (isStopExit(trade.exit_reason)) {
            overshoot_.count++;
            overshoot_.sum_r += trade.overshoot_r;
            overshoot_.max_r = std::max(overshoot_.max_r, trade.overshoot_r);
            if (trade.overshoot_r > 0.0) {
                overshoot_.nonzero++;
            }
        }
    }

    if (!r_values.empty()) {
        std::sort(r_values.begin(), r_values.end());
        const size_t mid = r_values.size() / 2;
        median_r_ = (r_values.size() % 2 == 1)
            ? r_values[mid]
            : 0.5 * (r_values[mid - 1] + r_values[mid]);
    }
}

RStats PerformanceStore::exitReason(ExitReason reason) const {
    auto it = by_exit_reason_.find(reason);
    return it == by_exit_reason_.end() ? RStats{} : it->second;
}

double PerformanceStore::profitFactorR() const {
    return (gross_loss_r_ > 1e-12) ? (gross_win_r_ / gross_loss_r_) : 0.0;
}

nlohmann::json PerformanceStore::toJson() const {
    nlohmann::json out;
    out["trades"] = total_.trades;
    out["wins"] = total_.wins;
    out["win_rate"] = total_.winRate();
    out["sum_r_total"] = total_.sum_r;
    out["avg_r"] = total_.averageR();
    out["median_r"] = median_r_;
    out["profit_factor_r"] = profitFactorR();

    nlohmann::json reasons = nlohmann::json::object();
    for (ExitReason reason : {ExitReason::SL, ExitReason::BE, ExitReason::TSL, ExitReason::TP, ExitReason::CLOSE}) {
        const RStats stats = exitReason(reason);
        reasons[toString(reason)] = {
            {"count", stats.trades},
            {"sum_r", stats.sum_r},
            {"avg_r", stats.averageR()}
        };
    }
    out["exit_reasons"] = reasons;

    nlohmann::json buckets = nlohmann::json::array();
    for (size_t i = 0; i < R_BUCKET_COUNT; ++i) {
        buckets.push_back({{"range", rBucketLabel(i)}, {"count", r_buckets_[i]}});
    }
    out["r_buckets"] = buckets;

    out["overshoot"] = {
        {"stop_exits", overshoot_.count},
        {"nonzero", overshoot_.nonzero},
        {"sum_r", overshoot_.sum_r},
        {"mean_r", overshoot_.meanR()},
        {"max_r", overshoot_.max_r}
    };
    out["audit"] = audit_.toJson();
    return out;
}

} // namespace engine
} // namespace wavetrail
