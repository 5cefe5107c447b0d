#include "common/Config.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace wavetrail;

namespace {
nlohmann::json baseDocument() {
    return nlohmann::json::parse(R"({
        "paths": {"inputs_dir": "data/in", "outputs_dir": "data/out"},
        "log_level": "debug",
        "symbols": ["ETHUSDT", "BTCUSDT"],
        "months": ["2025-01", "2025-02"],
        "engine": {"warmup": {"min_1m_bars": 120}},
        "atr": {"window": 10, "method": "wilder"},
        "entry": {"direction": "long", "cooldown_bars": 3},
        "regime": {"ts_mom": {"timeframes": [{"lookback_closes": 60}, 240]}},
        "eventwave": {
            "squeeze": {"pct_of_median": 0.7, "median_window": 200},
            "release": {"zscore_window": 20, "zscore_threshold": 2.5, "source": "return"}
        },
        "trigger": {"mode": "zscore", "zscore_window": 25},
        "risk": {
            "sl_mult": 1.5,
            "tp_mult": 3.0,
            "be": {"threshold_R": 0.75, "buffer_R": 0.05},
            "tsl": {
                "tsl_atr_mult": 2.0,
                "step_atr_mult": 0.25,
                "first_step_delay_secs": 300,
                "min_step_secs": 60,
                "floor_from_med_mult": 1.5,
                "quantize_tick_size": 0.01
            }
        },
        "symbols_cfg": {
            "BTCUSDT": {"tick_size": 0.1, "risk": {"sl_mult": 2.0}}
        }
    })");
}

bool throwsConfigError(const nlohmann::json& document, const std::string& symbol, const std::string& needle) {
    Config config;
    config.loadFromJson(document);
    try {
        config.resolveSymbol(symbol);
    } catch (const ConfigError& e) {
        return std::string(e.what()).find(needle) != std::string::npos;
    }
    return false;
}
}

int main() {
    {
        // Round trip through a file
        const auto path = std::filesystem::temp_directory_path() / "wavetrail_test_config.json";
        {
            std::ofstream out(path);
            out << baseDocument().dump(2);
        }

        Config config;
        config.load(path.string());
        std::filesystem::remove(path);

        assert(config.getInputsDir() == "data/in");
        assert(config.getOutputsDir() == "data/out");
        assert(config.getLogsDir() == "logs");
        assert(config.getLogLevel() == "debug");
        assert(config.getSymbols().size() == 2);
        assert(config.getMonths().size() == 2);

        const auto eth = config.resolveSymbol("ETHUSDT");
        assert(eth.symbol == "ETHUSDT");
        assert(eth.warmup_bars == 120);
        assert(eth.atr_window == 10);
        assert(eth.regime.lookbacks.size() == 2);
        assert(eth.regime.lookbacks[0] == 60 && eth.regime.lookbacks[1] == 240);
        assert(eth.regime.require_majority == 1);
        assert(eth.eventwave.median_window == 200);
        assert(eth.eventwave.source == engine::ReleaseSource::RETURN);
        assert(eth.eventwave.grace_bars == 5);
        assert(eth.trigger.mode == engine::TriggerMode::ZSCORE);
        assert(eth.trigger.zscore_window == 25);
        assert(eth.trigger.donchian_window == 20);
        assert(eth.entry.direction == engine::EntryDirection::LONG_ONLY);
        assert(eth.entry.cooldown_bars == 3);
        assert(eth.risk.sl_atr_mult == 1.5);
        assert(eth.risk.tp_atr_mult == 3.0);
        assert(eth.risk.be_enabled);
        assert(eth.risk.be_threshold_r == 0.75);
        assert(eth.risk.first_step_delay_secs == 300);
        assert(eth.risk.quantize_tick_size == 0.01);

        // Per-symbol overrides
        const auto btc = config.resolveSymbol("BTCUSDT");
        assert(btc.risk.sl_atr_mult == 2.0);
        assert(btc.risk.quantize_tick_size == 0.1);
        assert(btc.risk.tsl_atr_mult == 2.0);
    }

    {
        bool thrown = false;
        try {
            Config config;
            config.load("does/not/exist.json");
        } catch (const ConfigError&) {
            thrown = true;
        }
        assert(thrown);
    }

    {
        auto doc = baseDocument();
        doc["risk"]["tsl"].erase("min_step_secs");
        assert(throwsConfigError(doc, "ETHUSDT", "risk.tsl.min_step_secs"));

        doc = baseDocument();
        doc["risk"].erase("sl_mult");
        assert(throwsConfigError(doc, "ETHUSDT", "risk.sl_mult"));
        // The override still supplies it for BTCUSDT
        Config config;
        config.loadFromJson(doc);
        assert(config.resolveSymbol("BTCUSDT").risk.sl_atr_mult == 2.0);
    }

    {
        auto doc = baseDocument();
        doc["trigger"]["mode"] = "vwap";
        assert(throwsConfigError(doc, "ETHUSDT", "trigger.mode"));

        doc = baseDocument();
        doc["regime"]["ts_mom"]["require_majority"] = 3;
        assert(throwsConfigError(doc, "ETHUSDT", "require_majority"));

        doc = baseDocument();
        doc["risk"]["tsl"]["quantize_tick_size"] = -0.01;
        assert(throwsConfigError(doc, "ETHUSDT", "quantize_tick_size"));

        doc = baseDocument();
        doc["risk"]["sl_mult"] = "wide";
        assert(throwsConfigError(doc, "ETHUSDT", "risk.sl_mult"));
    }

    {
        // ATR settings under risk.atr and the squeeze window key
        auto doc = baseDocument();
        doc.erase("atr");
        doc["risk"]["atr"] = {{"window", 21}, {"method", "sma"}};
        Config config;
        config.loadFromJson(doc);
        auto resolved = config.resolveSymbol("ETHUSDT");
        assert(resolved.atr_window == 21);
        assert(resolved.atr_method == engine::AtrMethod::SMA);

        doc = baseDocument();
        doc.erase("atr");
        doc["eventwave"]["squeeze"]["atr_window"] = 30;
        config.loadFromJson(doc);
        resolved = config.resolveSymbol("ETHUSDT");
        assert(resolved.atr_window == 30);
        assert(resolved.atr_method == engine::AtrMethod::WILDER);

        // Agreeing keys are accepted, disagreeing ones rejected
        doc = baseDocument();
        doc["eventwave"]["squeeze"]["atr_window"] = 10;
        config.loadFromJson(doc);
        assert(config.resolveSymbol("ETHUSDT").atr_window == 10);

        doc["eventwave"]["squeeze"]["atr_window"] = 30;
        assert(throwsConfigError(doc, "ETHUSDT", "conflicting ATR windows"));
    }

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
