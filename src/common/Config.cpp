#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <initializer_list>

namespace wavetrail {

namespace {
using nlohmann::json;

std::string joinPath(std::initializer_list<const char*> path) {
    std::string out;
    for (const char* key : path) {
        if (!out.empty()) {
            out += ".";
        }
        out += key;
    }
    return out;
}

const json* findPath(const json& root, std::initializer_list<const char*> path) {
    const json* node = &root;
    for (const char* key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(key);
        if (it == node->end() || it->is_null()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

template<typename T>
T readAs(const json& node, std::initializer_list<const char*> path) {
    try {
        return node.get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("invalid type for " + joinPath(path) + ": " + e.what());
    }
}

template<typename T>
T required(const json& root, std::initializer_list<const char*> path) {
    const json* node = findPath(root, path);
    if (node == nullptr) {
        throw ConfigError("missing required parameter: " + joinPath(path));
    }
    return readAs<T>(*node, path);
}

template<typename T>
T optional(const json& root, std::initializer_list<const char*> path, T default_value) {
    const json* node = findPath(root, path);
    if (node == nullptr) {
        return default_value;
    }
    return readAs<T>(*node, path);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void check(bool ok, const std::string& symbol, const std::string& message) {
    if (!ok) {
        throw ConfigError(symbol + ": " + message);
    }
}

bool finiteAtLeast(double v, double lo) {
    return std::isfinite(v) && v >= lo;
}

std::vector<int> readLookbacks(const json& root) {
    const json* node = findPath(root, {"regime", "ts_mom", "timeframes"});
    if (node == nullptr) {
        throw ConfigError("missing required parameter: regime.ts_mom.timeframes");
    }
    if (!node->is_array()) {
        throw ConfigError("regime.ts_mom.timeframes must be an array");
    }

    std::vector<int> out;
    for (const auto& tf : *node) {
        if (tf.is_number_integer()) {
            out.push_back(tf.get<int>());
        } else if (tf.is_object() && tf.contains("lookback_closes")) {
            out.push_back(readAs<int>(tf["lookback_closes"], {"regime", "ts_mom", "timeframes", "lookback_closes"}));
        } else {
            throw ConfigError("regime.ts_mom.timeframes entries need lookback_closes");
        }
    }
    return out;
}
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path(path);
    if (!std::filesystem::exists(config_path)) {
        throw ConfigError("config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("config file could not be opened: " + config_path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw ConfigError("config parse error in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    LOG_INFO("Config loaded: {} ({} symbols, {} months)", config_path.string(), symbols_.size(), months_.size());
}

void Config::loadFromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigError("config root must be an object");
    }
    document_ = document;

    inputs_dir_ = optional<std::string>(document_, {"paths", "inputs_dir"}, "inputs");
    outputs_dir_ = optional<std::string>(document_, {"paths", "outputs_dir"}, "outputs");
    logs_dir_ = optional<std::string>(document_, {"paths", "logs_dir"}, "logs");
    log_level_ = optional<std::string>(document_, {"log_level"}, "info");
    symbols_ = optional<std::vector<std::string>>(document_, {"symbols"}, {});
    months_ = optional<std::vector<std::string>>(document_, {"months"}, {});
}

engine::SymbolConfig Config::resolveSymbol(const std::string& symbol) const {
    json doc = document_;
    double tick_override = -1.0;

    if (const json* overrides = findPath(document_, {"symbols_cfg"})) {
        auto it = overrides->find(symbol);
        if (it != overrides->end() && it->is_object()) {
            json patch = *it;
            if (patch.contains("tick_size")) {
                tick_override = readAs<double>(patch["tick_size"], {"symbols_cfg", "tick_size"});
                patch.erase("tick_size");
            }
            doc.merge_patch(patch);
        }
    }

    engine::SymbolConfig cfg;
    cfg.symbol = symbol;
    cfg.warmup_bars = optional<int>(doc, {"engine", "warmup", "min_1m_bars"}, 300);

    // One ATR series feeds the squeeze detector and the risk engine. The window
    // may be given as atr.window, risk.atr.window or eventwave.squeeze.atr_window.
    struct AtrWindowSource {
        const char* name;
        const json* node;
    };
    const AtrWindowSource atr_window_sources[] = {
        {"atr.window", findPath(doc, {"atr", "window"})},
        {"risk.atr.window", findPath(doc, {"risk", "atr", "window"})},
        {"eventwave.squeeze.atr_window", findPath(doc, {"eventwave", "squeeze", "atr_window"})},
    };
    const char* atr_window_key = nullptr;
    for (const auto& source : atr_window_sources) {
        if (source.node == nullptr) {
            continue;
        }
        const int window = readAs<int>(*source.node, {source.name});
        if (atr_window_key == nullptr) {
            cfg.atr_window = window;
            atr_window_key = source.name;
        } else if (window != cfg.atr_window) {
            throw ConfigError(symbol + ": conflicting ATR windows " + atr_window_key + "=" +
                              std::to_string(cfg.atr_window) + " and " + source.name + "=" +
                              std::to_string(window));
        }
    }

    std::string atr_method_text = "wilder";
    if (findPath(doc, {"atr", "method"}) != nullptr) {
        atr_method_text = required<std::string>(doc, {"atr", "method"});
    } else if (findPath(doc, {"risk", "atr", "method"}) != nullptr) {
        atr_method_text = required<std::string>(doc, {"risk", "atr", "method"});
    }
    const std::string atr_method = toLowerCopy(atr_method_text);
    if (atr_method == "wilder") {
        cfg.atr_method = engine::AtrMethod::WILDER;
    } else if (atr_method == "sma") {
        cfg.atr_method = engine::AtrMethod::SMA;
    } else {
        throw ConfigError(symbol + ": atr.method must be wilder or sma, got " + atr_method);
    }

    // Regime
    cfg.regime.lookbacks = readLookbacks(doc);
    cfg.regime.require_majority = optional<int>(doc, {"regime", "ts_mom", "require_majority"}, 1);
    cfg.regime.neutral_zone_pct = optional<double>(doc, {"regime", "ts_mom", "neutral_zone_pct"}, 0.0);

    // EventWave
    auto& ew = cfg.eventwave;
    ew.pct_of_median = optional<double>(doc, {"eventwave", "squeeze", "pct_of_median"}, ew.pct_of_median);
    ew.median_window = optional<int>(doc, {"eventwave", "squeeze", "median_window"}, ew.median_window);
    ew.zscore_window = optional<int>(doc, {"eventwave", "release", "zscore_window"}, ew.zscore_window);
    ew.zscore_threshold = optional<double>(doc, {"eventwave", "release", "zscore_threshold"}, ew.zscore_threshold);
    ew.grace_bars = optional<int>(doc, {"eventwave", "release", "grace_bars"}, ew.grace_bars);
    const std::string source = toLowerCopy(optional<std::string>(doc, {"eventwave", "release", "source"}, "close"));
    if (source == "close") {
        ew.source = engine::ReleaseSource::CLOSE;
    } else if (source == "return") {
        ew.source = engine::ReleaseSource::RETURN;
    } else {
        throw ConfigError(symbol + ": eventwave.release.source must be close or return, got " + source);
    }

    // Trigger
    auto& tr = cfg.trigger;
    const std::string mode = toLowerCopy(optional<std::string>(doc, {"trigger", "mode"}, "donchian"));
    if (mode == "donchian") {
        tr.mode = engine::TriggerMode::DONCHIAN;
    } else if (mode == "zscore") {
        tr.mode = engine::TriggerMode::ZSCORE;
    } else {
        throw ConfigError(symbol + ": trigger.mode must be donchian or zscore, got " + mode);
    }
    tr.donchian_window = optional<int>(doc, {"trigger", "donchian_window"}, tr.donchian_window);
    tr.zscore_window = optional<int>(doc, {"trigger", "zscore_window"}, tr.zscore_window);
    tr.zscore_threshold = optional<double>(doc, {"trigger", "zscore_threshold"}, tr.zscore_threshold);

    // Entry
    const std::string direction = toLowerCopy(optional<std::string>(doc, {"entry", "direction"}, "both"));
    if (direction == "both") {
        cfg.entry.direction = engine::EntryDirection::BOTH;
    } else if (direction == "long") {
        cfg.entry.direction = engine::EntryDirection::LONG_ONLY;
    } else if (direction == "short") {
        cfg.entry.direction = engine::EntryDirection::SHORT_ONLY;
    } else {
        throw ConfigError(symbol + ": entry.direction must be long, short or both, got " + direction);
    }
    cfg.entry.cooldown_bars = optional<int>(doc, {"entry", "cooldown_bars"}, 0);

    // Risk
    auto& rk = cfg.risk;
    rk.sl_atr_mult = required<double>(doc, {"risk", "sl_mult"});
    rk.tp_atr_mult = optional<double>(doc, {"risk", "tp_mult"}, 0.0);
    rk.be_enabled = optional<bool>(doc, {"risk", "be", "enabled"}, true);
    rk.be_threshold_r = optional<double>(doc, {"risk", "be", "threshold_R"}, 0.5);
    rk.be_buffer_r = optional<double>(doc, {"risk", "be", "buffer_R"}, 0.0);
    rk.tsl_enabled = optional<bool>(doc, {"risk", "tsl", "enabled"}, true);
    rk.tsl_atr_mult = required<double>(doc, {"risk", "tsl", "tsl_atr_mult"});
    rk.step_atr_mult = optional<double>(doc, {"risk", "tsl", "step_atr_mult"}, 0.0);
    rk.first_step_delay_secs = required<long long>(doc, {"risk", "tsl", "first_step_delay_secs"});
    rk.min_step_secs = required<long long>(doc, {"risk", "tsl", "min_step_secs"});
    rk.floor_from_med_mult = required<double>(doc, {"risk", "tsl", "floor_from_med_mult"});
    rk.quantize_tick_size = optional<double>(doc, {"risk", "tsl", "quantize_tick_size"}, 0.0);
    if (tick_override >= 0.0) {
        rk.quantize_tick_size = tick_override;
    }

    // Validation
    check(cfg.warmup_bars >= 1, symbol, "engine.warmup.min_1m_bars must be >= 1");
    check(cfg.atr_window >= 1, symbol, "atr.window must be >= 1");

    check(!cfg.regime.lookbacks.empty(), symbol, "regime.ts_mom.timeframes must not be empty");
    for (int lb : cfg.regime.lookbacks) {
        check(lb >= 1, symbol, "regime lookback_closes must be >= 1");
    }
    check(cfg.regime.require_majority >= 1 &&
          cfg.regime.require_majority <= static_cast<int>(cfg.regime.lookbacks.size()),
          symbol, "regime.ts_mom.require_majority must be within [1, number of timeframes]");
    check(finiteAtLeast(cfg.regime.neutral_zone_pct, 0.0), symbol, "regime.ts_mom.neutral_zone_pct must be >= 0");

    check(std::isfinite(ew.pct_of_median) && ew.pct_of_median > 0.0, symbol, "eventwave.squeeze.pct_of_median must be > 0");
    check(ew.median_window >= 1, symbol, "eventwave.squeeze.median_window must be >= 1");
    check(ew.zscore_window >= 2, symbol, "eventwave.release.zscore_window must be >= 2");
    check(std::isfinite(ew.zscore_threshold) && ew.zscore_threshold > 0.0, symbol, "eventwave.release.zscore_threshold must be > 0");
    check(ew.grace_bars >= 0, symbol, "eventwave.release.grace_bars must be >= 0");

    check(tr.donchian_window >= 1, symbol, "trigger.donchian_window must be >= 1");
    check(tr.zscore_window >= 2, symbol, "trigger.zscore_window must be >= 2");
    check(std::isfinite(tr.zscore_threshold) && tr.zscore_threshold > 0.0, symbol, "trigger.zscore_threshold must be > 0");

    check(cfg.entry.cooldown_bars >= 0, symbol, "entry.cooldown_bars must be >= 0");

    check(std::isfinite(rk.sl_atr_mult) && rk.sl_atr_mult > 0.0, symbol, "risk.sl_mult must be > 0");
    check(finiteAtLeast(rk.tp_atr_mult, 0.0), symbol, "risk.tp_mult must be >= 0");
    check(finiteAtLeast(rk.be_threshold_r, 0.0), symbol, "risk.be.threshold_R must be >= 0");
    check(finiteAtLeast(rk.be_buffer_r, 0.0), symbol, "risk.be.buffer_R must be >= 0");
    check(finiteAtLeast(rk.tsl_atr_mult, 0.0), symbol, "risk.tsl.tsl_atr_mult must be >= 0");
    check(finiteAtLeast(rk.step_atr_mult, 0.0), symbol, "risk.tsl.step_atr_mult must be >= 0");
    check(rk.first_step_delay_secs >= 0, symbol, "risk.tsl.first_step_delay_secs must be >= 0");
    check(rk.min_step_secs >= 0, symbol, "risk.tsl.min_step_secs must be >= 0");
    check(finiteAtLeast(rk.floor_from_med_mult, 0.0), symbol, "risk.tsl.floor_from_med_mult must be >= 0");
    check(finiteAtLeast(rk.quantize_tick_size, 0.0), symbol, "risk.tsl.quantize_tick_size must be >= 0");

    return cfg;
}

} // namespace wavetrail
