#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"
#include "engine/PerformanceStore.h"

namespace wavetrail {
namespace backtest {

// Per-run output files under outputs_dir:
//   trades_<SYMBOL>_<YYYY-MM>.csv
//   summary_<SYMBOL>_<YYYY-MM>.json
class ResultWriter {
public:
    ResultWriter(std::string outputs_dir, double tick_size);

    // Both return the written path. Throw std::runtime_error on I/O failure.
    std::string writeTrades(const std::string& symbol, const std::string& month,
                            const std::vector<risk::TradeRecord>& trades) const;
    std::string writeSummary(const std::string& symbol, const std::string& month,
                             const BacktestEngine::Result& result,
                             const engine::PerformanceStore& performance) const;

    static std::string tradesHeader();
    std::string tradeRow(const risk::TradeRecord& trade) const;

    static nlohmann::json buildSummary(const BacktestEngine::Result& result,
                                       const engine::PerformanceStore& performance);

private:
    std::string outputs_dir_;
    double tick_size_;
};

} // namespace backtest
} // namespace wavetrail
