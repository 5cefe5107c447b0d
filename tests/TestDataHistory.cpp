#include "backtest/DataHistory.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace wavetrail;
using wavetrail::backtest::BarFileFormat;
using wavetrail::backtest::DataHistory;
using wavetrail::backtest::Tick;

namespace fs = std::filesystem;

namespace {
constexpr long long JAN_1_2025_MS = 1735689600000LL;

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

bool throwsDataError(const std::string& text) {
    try {
        DataHistory::parseTimestamp(text);
    } catch (const DataError&) {
        return true;
    }
    return false;
}
}

int main() {
    const fs::path root = fs::temp_directory_path() / "wavetrail_test_data";
    fs::remove_all(root);

    // Timestamp normalization
    {
        assert(DataHistory::parseTimestamp("2025-01-01T00:00:00Z") == JAN_1_2025_MS);
        assert(DataHistory::parseTimestamp("2025-01-01 00:01:00") == JAN_1_2025_MS + 60000);
        assert(DataHistory::parseTimestamp("2025-01-01T09:00:00+09:00") == JAN_1_2025_MS);
        assert(DataHistory::parseTimestamp("2025-01-01T00:00:00.250Z") == JAN_1_2025_MS + 250);
        assert(DataHistory::parseTimestamp("1735689600") == JAN_1_2025_MS);
        assert(DataHistory::parseTimestamp("1735689600000") == JAN_1_2025_MS);
        assert(DataHistory::parseTimestamp("1735689600000000") == JAN_1_2025_MS);

        assert(DataHistory::toMsTimestamp(1735689600LL) == JAN_1_2025_MS);
        assert(DataHistory::toMsTimestamp(JAN_1_2025_MS) == JAN_1_2025_MS);
        assert(DataHistory::toMsTimestamp(JAN_1_2025_MS * 1000) == JAN_1_2025_MS);

        assert(throwsDataError(""));
        assert(throwsDataError("yesterday"));
        assert(throwsDataError("2025-13-01T00:00:00Z"));
        assert(throwsDataError("2025-01-01T00:00:00 UTC"));
    }

    // Header with BOM, quoted cells, mixed timestamp formats, a bad row
    {
        const fs::path path = root / "header.csv";
        writeFile(path,
                  "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\r\n"
                  "2025-01-01T00:00:00Z,100,101,99,100.5,12\r\n"
                  "1735689660,\"100.5\",102,100,101.5,8\r\n"
                  "not-a-time,1,2,0,1,1\r\n"
                  "\r\n"
                  "1735689720000,101.5,nan,101,101,3\r\n");

        const auto bars = DataHistory::loadCSV(path.string());
        assert(bars.size() == 3);
        assert(bars[0].timestamp == JAN_1_2025_MS);
        assert(bars[0].close == 100.5);
        assert(bars[0].volume == 12.0);
        assert(bars[1].timestamp == JAN_1_2025_MS + 60000);
        assert(bars[1].open == 100.5);
        // NaN fields are kept for the engine to reject with a warning
        assert(bars[2].timestamp == JAN_1_2025_MS + 120000);
        assert(std::isnan(bars[2].high));
    }

    // Reordered header with aliases and a semicolon delimiter
    {
        const fs::path path = root / "aliases.csv";
        writeFile(path,
                  "close;low;high;open;open_time\n"
                  "10.5;9;11;10;1735689600000\n");

        const auto bars = DataHistory::loadCSV(path.string());
        assert(bars.size() == 1);
        assert(bars[0].open == 10.0 && bars[0].high == 11.0);
        assert(bars[0].low == 9.0 && bars[0].close == 10.5);
        assert(bars[0].volume == 0.0);
    }

    // Headerless files are read positionally
    {
        const fs::path path = root / "positional.csv";
        writeFile(path,
                  "1735689600000,1,2,0.5,1.5,100\n"
                  "1735689660000,1.5,2.5,1,2\n"
                  "1735689720000,2\n");

        const auto bars = DataHistory::loadCSV(path.string());
        assert(bars.size() == 2);
        assert(bars[1].close == 2.0);
        assert(bars[1].volume == 0.0);
    }

    // Missing file yields no bars
    {
        assert(DataHistory::loadCSV((root / "absent.csv").string()).empty());
    }

    // JSON bars with long and short keys, sorted on load
    {
        const fs::path path = root / "bars.json";
        writeFile(path,
                  R"([
                      {"t": 1735689660, "o": 2, "h": 3, "l": 1, "c": 2.5},
                      {"timestamp": "2025-01-01T00:00:00Z", "open": 1, "high": 2, "low": 0.5, "close": 1.5, "volume": 7},
                      {"open": 1, "high": 1, "low": 1, "close": 1}
                  ])");

        const auto bars = DataHistory::loadJSON(path.string());
        assert(bars.size() == 2);
        assert(bars[0].timestamp == JAN_1_2025_MS);
        assert(bars[0].volume == 7.0);
        assert(bars[1].timestamp == JAN_1_2025_MS + 60000);
        assert(bars[1].close == 2.5);
    }

    // Trades bucketed into minute bars
    {
        std::vector<Tick> ticks = {
            {JAN_1_2025_MS + 61000, 105.0, 1.0},
            {JAN_1_2025_MS + 1000, 100.0, 0.5},
            {JAN_1_2025_MS + 30000, 102.0, 1.5},
            {JAN_1_2025_MS + 59999, 99.0, 2.0},
            {JAN_1_2025_MS + 180000, 104.0, 3.0},
        };
        const auto bars = DataHistory::aggregateTicksTo1m(ticks);
        assert(bars.size() == 3);   // empty minutes are not synthesized

        assert(bars[0].timestamp == JAN_1_2025_MS);
        assert(bars[0].open == 100.0);
        assert(bars[0].high == 102.0);
        assert(bars[0].low == 99.0);
        assert(bars[0].close == 99.0);
        assert(std::abs(bars[0].volume - 4.0) < 1e-12);

        assert(bars[1].timestamp == JAN_1_2025_MS + 60000);
        assert(bars[1].open == 105.0 && bars[1].close == 105.0);
        assert(bars[2].timestamp == JAN_1_2025_MS + 180000);

        assert(DataHistory::aggregateTicksTo1m({}).empty());
    }

    // Tick file through the generic loader
    {
        const fs::path path = root / "ticks.csv";
        writeFile(path,
                  "id,price,qty,time\n"
                  "1,100,1,1735689600000\n"
                  "2,101,2,1735689610000\n"
                  "3,oops,1,1735689620000\n"
                  "4,99,1,1735689670000\n");

        const auto bars = DataHistory::load({path.string(), BarFileFormat::TICK_CSV});
        assert(bars.size() == 2);
        assert(bars[0].high == 101.0);
        assert(bars[0].volume == 3.0);
        assert(bars[1].open == 99.0);
    }

    // Month file lookup order
    {
        const fs::path inputs = root / "inputs";
        assert(!DataHistory::findMonthFile(inputs.string(), "BTCUSDT", "2025-01").has_value());

        writeFile(inputs / "BTCUSDT" / "BTCUSDT-2025-01.json", "[]");
        auto found = DataHistory::findMonthFile(inputs.string(), "BTCUSDT", "2025-01");
        assert(found.has_value());
        assert(found->format == BarFileFormat::OHLCV_JSON);

        writeFile(inputs / "BTCUSDT" / "BTCUSDT-2025-01.csv", "");
        found = DataHistory::findMonthFile(inputs.string(), "BTCUSDT", "2025-01");
        assert(found->format == BarFileFormat::OHLCV_CSV);
        assert(fs::path(found->path).parent_path().filename() == "BTCUSDT");

        writeFile(inputs / "BTCUSDT-2025-01.csv", "");
        found = DataHistory::findMonthFile(inputs.string(), "BTCUSDT", "2025-01");
        assert(fs::path(found->path).parent_path() == inputs);

        writeFile(inputs / "BTCUSDT" / "BTCUSDT-ticks-2025-01.csv", "");
        found = DataHistory::findMonthFile(inputs.string(), "BTCUSDT", "2025-01");
        assert(found->format == BarFileFormat::TICK_CSV);

        // Other months are unaffected
        assert(!DataHistory::findMonthFile(inputs.string(), "BTCUSDT", "2025-02").has_value());
    }

    fs::remove_all(root);
    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
