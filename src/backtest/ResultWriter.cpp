#include "backtest/ResultWriter.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace wavetrail {
namespace backtest {

namespace {
std::ofstream openOutput(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open output file " + path.string());
    }
    return out;
}

// Prices that never went through quantization keep every significant digit
std::string formatPrice(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    return std::string(buf);
}

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

std::string formatR(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << value;
    return oss.str();
}
} // namespace

ResultWriter::ResultWriter(std::string outputs_dir, double tick_size)
    : outputs_dir_(std::move(outputs_dir)), tick_size_(tick_size) {}

std::string ResultWriter::tradesHeader() {
    return "symbol,side,entry_bar,exit_bar,entry_ts,exit_ts,entry_price,exit_price,"
           "initial_stop,final_stop,take_profit,exit_reason,r_multiple,overshoot_r,step_count";
}

// Stop columns sit on the tick grid and print at tick precision; entry,
// target and non-stop exit prices print in full.
std::string ResultWriter::tradeRow(const risk::TradeRecord& trade) const {
    const std::string exit_price = isStopExit(trade.exit_reason)
        ? common::priceToString(trade.exit_price, tick_size_)
        : formatPrice(trade.exit_price);

    std::ostringstream oss;
    oss << trade.symbol << ','
        << toString(trade.side) << ','
        << trade.entry_bar << ','
        << trade.exit_bar << ','
        << trade.entry_timestamp << ','
        << trade.exit_timestamp << ','
        << formatPrice(trade.entry_price) << ','
        << exit_price << ','
        << common::priceToString(trade.initial_stop, tick_size_) << ','
        << common::priceToString(trade.final_stop, tick_size_) << ','
        << formatPrice(trade.take_profit) << ','
        << toString(trade.exit_reason) << ','
        << formatR(trade.r_multiple) << ','
        << formatR(trade.overshoot_r) << ','
        << trade.step_count;
    return oss.str();
}

std::string ResultWriter::writeTrades(const std::string& symbol, const std::string& month,
                                      const std::vector<risk::TradeRecord>& trades) const {
    const auto path = std::filesystem::path(outputs_dir_) / ("trades_" + symbol + "_" + month + ".csv");
    std::ofstream out = openOutput(path);

    out << tradesHeader() << "\n";
    for (const auto& trade : trades) {
        out << tradeRow(trade) << "\n";
    }
    if (!out) {
        throw std::runtime_error("failed writing " + path.string());
    }

    LOG_INFO("Wrote {} trades to {}", trades.size(), path.string());
    return path.string();
}

nlohmann::json ResultWriter::buildSummary(const BacktestEngine::Result& result,
                                          const engine::PerformanceStore& performance) {
    nlohmann::json summary = performance.toJson();
    summary["symbol"] = result.symbol;
    summary["first_timestamp"] = result.first_timestamp;
    summary["last_timestamp"] = result.last_timestamp;

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& warning : result.warnings) {
        warnings.push_back({
            {"timestamp", warning.timestamp},
            {"row", warning.source_row},
            {"reason", warning.reason}
        });
    }
    summary["warnings"] = warnings;
    return summary;
}

std::string ResultWriter::writeSummary(const std::string& symbol, const std::string& month,
                                       const BacktestEngine::Result& result,
                                       const engine::PerformanceStore& performance) const {
    const auto path = std::filesystem::path(outputs_dir_) / ("summary_" + symbol + "_" + month + ".json");
    std::ofstream out = openOutput(path);

    nlohmann::json summary = buildSummary(result, performance);
    summary["month"] = month;
    out << summary.dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("failed writing " + path.string());
    }

    LOG_INFO("Wrote summary to {}", path.string());
    return path.string();
}

} // namespace backtest
} // namespace wavetrail
