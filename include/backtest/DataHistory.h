#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace wavetrail {
namespace backtest {

enum class BarFileFormat { OHLCV_CSV, TICK_CSV, OHLCV_JSON };

struct BarFile {
    std::string path;
    BarFileFormat format = BarFileFormat::OHLCV_CSV;
};

struct Tick {
    long long timestamp = 0;    // epoch ms
    double price = 0.0;
    double qty = 0.0;
};

class DataHistory {
public:
    // Load 1m bars from a CSV file.
    // Columns: timestamp|ts|time|open_time, open, high, low, close[, volume]
    // Header optional (positional without one). Timestamps may be epoch
    // seconds, epoch milliseconds or ISO-8601 and are normalized to ms.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Load bars from a JSON array ({timestamp|t, open|o, high|h, low|l, close|c, volume|v})
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Load trades (timestamp|time|ts, price|p, qty|quantity|size|amount|vol|volume)
    static std::vector<Tick> loadTickCSV(const std::string& file_path);

    // Bucket trades into 1m bars: first/max/min/last price, summed qty
    static std::vector<Bar> aggregateTicksTo1m(std::vector<Tick> ticks);

    static std::vector<Bar> load(const BarFile& file);

    // First existing file for symbol/month under inputs_dir. Tick files
    // are preferred over prebuilt OHLCV files.
    static std::optional<BarFile> findMonthFile(const std::string& inputs_dir,
                                                const std::string& symbol,
                                                const std::string& month);
    static std::vector<BarFile> candidateFiles(const std::string& inputs_dir,
                                               const std::string& symbol,
                                               const std::string& month);

    // Epoch seconds / ms / ISO-8601 -> epoch ms. Throws DataError.
    static long long parseTimestamp(const std::string& text);
    static long long toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace wavetrail
