#pragma once

#include <string>
#include <vector>

namespace wavetrail {
namespace engine {

enum class AtrMethod { WILDER, SMA };
enum class TriggerMode { DONCHIAN, ZSCORE };
enum class ReleaseSource { CLOSE, RETURN };
enum class EntryDirection { BOTH, LONG_ONLY, SHORT_ONLY };

struct RegimeParams {
    std::vector<int> lookbacks;          // minutes == bars
    int require_majority = 1;            // windows that must agree
    double neutral_zone_pct = 0.0;       // |change| / base price inside the zone -> FLAT
};

struct EventWaveParams {
    double pct_of_median = 0.8;          // squeeze when atr < pct * median_atr
    int median_window = 240;
    int zscore_window = 30;
    double zscore_threshold = 2.0;
    ReleaseSource source = ReleaseSource::CLOSE;
    int grace_bars = 5;                  // ignition still counts this many bars after the squeeze ends
};

struct TriggerParams {
    TriggerMode mode = TriggerMode::DONCHIAN;
    int donchian_window = 20;
    int zscore_window = 30;
    double zscore_threshold = 2.0;
};

struct EntryParams {
    EntryDirection direction = EntryDirection::BOTH;
    int cooldown_bars = 0;
};

struct RiskParams {
    double sl_atr_mult = 1.0;
    double tp_atr_mult = 0.0;            // <= 0 disables the target

    bool be_enabled = true;
    double be_threshold_r = 0.5;
    double be_buffer_r = 0.0;

    bool tsl_enabled = true;
    double tsl_atr_mult = 2.0;
    double step_atr_mult = 0.0;
    long long first_step_delay_secs = 300;
    long long min_step_secs = 60;
    double floor_from_med_mult = 1.5;
    double quantize_tick_size = 0.0;
};

// Resolved, validated parameters for one symbol. Immutable for the run.
struct SymbolConfig {
    std::string symbol;
    int warmup_bars = 300;
    int atr_window = 14;
    AtrMethod atr_method = AtrMethod::WILDER;

    RegimeParams regime;
    EventWaveParams eventwave;
    TriggerParams trigger;
    EntryParams entry;
    RiskParams risk;
};

} // namespace engine
} // namespace wavetrail
