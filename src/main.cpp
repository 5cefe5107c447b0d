#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/ResultWriter.h"
#include "engine/PerformanceStore.h"

#include <cctype>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace wavetrail;

namespace {

struct CliOptions {
    std::string config_path;
    std::string symbol;
    std::string month;
};

void printUsage() {
    std::cout << "Usage: wavetrail --config <path> [--symbol SYM] [--month YYYY-MM]\n";
}

bool isMonth(const std::string& s) {
    if (s.size() != 7 || s[4] != '-') return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    const int month = std::stoi(s.substr(5, 2));
    return month >= 1 && month <= 12;
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--symbol" && i + 1 < argc) {
            options.symbol = argv[++i];
        } else if (arg == "--month" && i + 1 < argc) {
            options.month = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }
    return !options.config_path.empty();
}

void printSummary(const std::string& symbol, const std::string& month,
                  const engine::PerformanceStore& performance) {
    const auto& total = performance.total();
    const auto& audit = performance.audit();

    std::cout << "\n=== " << symbol << " " << month << " ===\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Bars:        " << audit.bars_seen << " (skipped " << audit.bars_skipped << ")\n";
    std::cout << "Releases:    " << audit.releases << ", triggers " << audit.triggers << "\n";
    std::cout << "Trades:      " << total.trades << "\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Win rate:    " << (total.winRate() * 100.0) << "%\n";
    std::cout << "Total R:     " << total.sum_r << "\n";
    std::cout << "Avg R:       " << total.averageR() << "\n";
    std::cout << "Median R:    " << performance.medianR() << "\n";
    for (ExitReason reason : {ExitReason::SL, ExitReason::BE, ExitReason::TSL, ExitReason::TP, ExitReason::CLOSE}) {
        const auto stats = performance.exitReason(reason);
        std::cout << "  " << std::left << std::setw(6) << toString(reason) << std::right
                  << stats.trades << " trades, R " << stats.sum_r << "\n";
    }
    std::cout << "Overshoot:   mean " << performance.overshoot().meanR()
              << "R, max " << performance.overshoot().max_r << "R\n";
    std::cout << "---------------------------------------------\n";
    std::cout.unsetf(std::ios::floatfield);
}

// One symbol-month run. Returns false when it failed.
bool runSymbolMonth(const Config& config, const engine::SymbolConfig& symbol_config,
                    const std::string& month) {
    const std::string& symbol = symbol_config.symbol;

    const auto file = backtest::DataHistory::findMonthFile(config.getInputsDir(), symbol, month);
    if (!file) {
        LOG_ERROR("{} {}: no data file under {}", symbol, month, config.getInputsDir());
        return false;
    }

    const std::vector<Bar> bars = backtest::DataHistory::load(*file);
    if (bars.empty()) {
        LOG_ERROR("{} {}: no bars loaded from {}", symbol, month, file->path);
        return false;
    }

    backtest::BacktestEngine backtester(symbol_config);
    const auto result = backtester.run(bars);

    engine::PerformanceStore performance;
    performance.rebuild(result.trades, result.audit);

    backtest::ResultWriter writer(config.getOutputsDir(), symbol_config.risk.quantize_tick_size);
    writer.writeTrades(symbol, month, result.trades);
    writer.writeSummary(symbol, month, result, performance);

    printSummary(symbol, month, performance);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 1;
    }

    Config config;
    try {
        config.load(options.config_path);
        Logger::getInstance().initialize(config.getLogsDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << "\n";
        return 1;
    }

    if (!options.symbol.empty()) {
        config.setSymbols({options.symbol});
    }
    if (!options.month.empty()) {
        config.setMonths({options.month});
    }

    const auto symbols = config.getSymbols();
    const auto months = config.getMonths();
    if (symbols.empty() || months.empty()) {
        LOG_ERROR("Nothing to run: {} symbols, {} months configured", symbols.size(), months.size());
        return 1;
    }

    LOG_INFO("WaveTrail backtest: {} symbols x {} months", symbols.size(), months.size());

    int succeeded = 0;
    int failed = 0;

    for (const auto& symbol : symbols) {
        engine::SymbolConfig symbol_config;
        try {
            symbol_config = config.resolveSymbol(symbol);
        } catch (const ConfigError& e) {
            LOG_ERROR("{}: configuration rejected: {}", symbol, e.what());
            failed += static_cast<int>(months.size());
            continue;
        }

        for (const auto& month : months) {
            if (!isMonth(month)) {
                LOG_ERROR("{}: invalid month '{}' (expected YYYY-MM)", symbol, month);
                failed++;
                continue;
            }
            try {
                if (runSymbolMonth(config, symbol_config, month)) {
                    succeeded++;
                } else {
                    failed++;
                }
            } catch (const StateInvariantViolation& e) {
                LOG_ERROR("{} {}: run aborted: {}", symbol, month, e.what());
                failed++;
            } catch (const std::exception& e) {
                LOG_ERROR("{} {}: run failed: {}", symbol, month, e.what());
                failed++;
            }
        }
    }

    LOG_INFO("Finished: {} runs succeeded, {} failed", succeeded, failed);
    return failed == 0 ? 0 : 1;
}
