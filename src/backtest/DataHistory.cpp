#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include "common/Errors.h"
#include "common/Logger.h"

namespace wavetrail {
namespace backtest {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

char detectDelimiter(const std::string& line) {
    if (line.find(',') != std::string::npos) return ',';
    if (line.find(';') != std::string::npos) return ';';
    if (line.find('\t') != std::string::npos) return '\t';
    return ',';
}

std::vector<std::string> splitRow(const std::string& line, char delimiter) {
    std::vector<std::string> row;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter)) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

bool isNumber(const std::string& s) {
    if (s.empty()) return false;
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end != s.c_str() && *end == '\0';
}

double parseNumber(const std::string& s) {
    const std::string lowered = toLower(s);
    if (lowered == "nan" || lowered.empty()) {
        return std::nan("");
    }
    return std::stod(s);
}

// Index of the first header cell matching one of the aliases, -1 if none
int findColumn(const std::vector<std::string>& header, std::initializer_list<const char*> aliases) {
    for (const char* alias : aliases) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (toLower(header[i]) == alias) {
                return static_cast<int>(i);
            }
        }
    }
    return -1;
}

// Days since 1970-01-01 for a proleptic Gregorian date
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

long long parseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    double second = 0.0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
        throw DataError("unparseable timestamp '" + text + "'");
    }
    size_t pos = static_cast<size_t>(consumed);

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        int time_consumed = 0;
        const char* time_part = text.c_str() + pos + 1;
        if (std::sscanf(time_part, "%2d:%2d%n", &hour, &minute, &time_consumed) != 2) {
            throw DataError("unparseable timestamp '" + text + "'");
        }
        pos += 1 + static_cast<size_t>(time_consumed);
        if (pos < text.size() && text[pos] == ':') {
            char* end = nullptr;
            second = std::strtod(text.c_str() + pos + 1, &end);
            pos = static_cast<size_t>(end - text.c_str());
        }
    }

    long long offset_secs = 0;
    if (pos < text.size()) {
        const std::string zone = text.substr(pos);
        int oh = 0, om = 0;
        if (zone == "Z" || zone == "z") {
            offset_secs = 0;
        } else if ((zone[0] == '+' || zone[0] == '-') &&
                   (std::sscanf(zone.c_str() + 1, "%2d:%2d", &oh, &om) == 2 ||
                    std::sscanf(zone.c_str() + 1, "%2d%2d", &oh, &om) == 2)) {
            offset_secs = (zone[0] == '+' ? 1 : -1) * (oh * 3600LL + om * 60LL);
        } else {
            throw DataError("unparseable timezone in timestamp '" + text + "'");
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second >= 61.0) {
        throw DataError("timestamp out of range '" + text + "'");
    }

    const long long days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const long long whole_secs = days * 86400LL + hour * 3600LL + minute * 60LL - offset_secs;
    return whole_secs * 1000LL + static_cast<long long>(std::llround(second * 1000.0));
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace

long long DataHistory::toMsTimestamp(long long ts) {
    const long long magnitude = ts < 0 ? -ts : ts;
    if (magnitude >= 100000000000000LL) {   // microseconds
        return ts / 1000;
    }
    if (magnitude < 100000000000LL) {       // seconds
        return ts * 1000;
    }
    return ts;
}

long long DataHistory::parseTimestamp(const std::string& text) {
    const std::string cell = trim(text);
    if (cell.empty()) {
        throw DataError("empty timestamp");
    }
    if (isNumber(cell)) {
        return toMsTimestamp(static_cast<long long>(std::llround(std::stod(cell))));
    }
    return parseIso8601(cell);
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    int col_ts = 0, col_open = 1, col_high = 2, col_low = 3, col_close = 4, col_volume = 5;
    bool header_seen = false;
    char delimiter = ',';
    bool delimiter_known = false;
    size_t row_number = 0;
    size_t skipped = 0;
    std::string line;

    while (std::getline(file, line)) {
        row_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) continue;

        if (!delimiter_known) {
            delimiter = detectDelimiter(line);
            delimiter_known = true;
        }
        const std::vector<std::string> row = splitRow(line, delimiter);

        if (!header_seen && !row.empty() && !isNumber(row[0]) &&
            findColumn(row, {"timestamp", "ts", "time", "open_time", "date", "datetime"}) >= 0) {
            col_ts = findColumn(row, {"timestamp", "ts", "time", "open_time", "date", "datetime"});
            col_open = findColumn(row, {"open", "o"});
            col_high = findColumn(row, {"high", "h"});
            col_low = findColumn(row, {"low", "l"});
            col_close = findColumn(row, {"close", "c"});
            col_volume = findColumn(row, {"volume", "vol", "v", "qty"});
            header_seen = true;
            if (col_open < 0 || col_high < 0 || col_low < 0 || col_close < 0) {
                LOG_ERROR("CSV header missing OHLC columns: {}", file_path);
                return bars;
            }
            continue;
        }
        header_seen = true;

        const int needed = std::max({col_ts, col_open, col_high, col_low, col_close});
        if (static_cast<int>(row.size()) <= needed) {
            skipped++;
            LOG_WARN("{}:{} short row skipped", file_path, row_number);
            continue;
        }

        try {
            Bar bar;
            bar.timestamp = parseTimestamp(row[col_ts]);
            bar.open = parseNumber(row[col_open]);
            bar.high = parseNumber(row[col_high]);
            bar.low = parseNumber(row[col_low]);
            bar.close = parseNumber(row[col_close]);
            bar.volume = (col_volume >= 0 && col_volume < static_cast<int>(row.size()))
                ? parseNumber(row[col_volume]) : 0.0;
            bars.push_back(bar);
        } catch (const std::exception& e) {
            skipped++;
            LOG_WARN("Error parsing row {}:{} - {}", file_path, row_number, e.what());
        }
    }

    LOG_INFO("Loaded {} bars from {} ({} rows skipped)", bars.size(), file_path, skipped);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    nlohmann::json j;
    try {
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON bar file is not an array: {}", file_path);
            return bars;
        }

        auto number = [](const nlohmann::json& item, const char* key, const char* short_key) {
            if (item.contains(key) && item[key].is_number()) return item[key].get<double>();
            if (item.contains(short_key) && item[short_key].is_number()) return item[short_key].get<double>();
            return std::nan("");
        };

        for (const auto& item : j) {
            Bar bar;
            const nlohmann::json* ts = nullptr;
            if (item.contains("timestamp")) ts = &item["timestamp"];
            else if (item.contains("t")) ts = &item["t"];

            if (ts == nullptr) {
                LOG_WARN("JSON bar without timestamp skipped: {}", item.dump());
                continue;
            }
            try {
                bar.timestamp = ts->is_string() ? parseTimestamp(ts->get<std::string>())
                                                : toMsTimestamp(ts->get<long long>());
            } catch (const std::exception& e) {
                LOG_WARN("JSON bar timestamp rejected: {} - {}", item.dump(), e.what());
                continue;
            }

            bar.open = number(item, "open", "o");
            bar.high = number(item, "high", "h");
            bar.low = number(item, "low", "l");
            bar.close = number(item, "close", "c");
            bar.volume = item.contains("volume") || item.contains("v") ? number(item, "volume", "v") : 0.0;
            bars.push_back(bar);
        }
        // Ensure sorted by timestamp ascending
        std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
            return a.timestamp < b.timestamp;
        });

    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
    }

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Tick> DataHistory::loadTickCSV(const std::string& file_path) {
    std::vector<Tick> ticks;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open tick file: {}", file_path);
        return ticks;
    }

    int col_ts = 0, col_price = 1, col_qty = 2;
    bool header_seen = false;
    char delimiter = ',';
    bool delimiter_known = false;
    size_t skipped = 0;
    std::string line;

    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) continue;

        if (!delimiter_known) {
            delimiter = detectDelimiter(line);
            delimiter_known = true;
        }
        const std::vector<std::string> row = splitRow(line, delimiter);

        if (!header_seen && !row.empty() && !isNumber(row[0])) {
            const int ts = findColumn(row, {"timestamp", "time", "ts"});
            const int price = findColumn(row, {"price", "p"});
            if (ts >= 0 || price >= 0) {
                if (ts < 0 || price < 0) {
                    LOG_ERROR("Tick file missing timestamp/price columns: {}", file_path);
                    return ticks;
                }
                col_ts = ts;
                col_price = price;
                col_qty = findColumn(row, {"qty", "quantity", "size", "amount", "vol", "volume"});
                header_seen = true;
                continue;
            }
        }
        header_seen = true;

        if (static_cast<int>(row.size()) <= std::max(col_ts, col_price)) {
            skipped++;
            continue;
        }

        try {
            Tick tick;
            tick.timestamp = parseTimestamp(row[col_ts]);
            tick.price = std::stod(row[col_price]);
            tick.qty = (col_qty >= 0 && col_qty < static_cast<int>(row.size())) ? std::stod(row[col_qty]) : 1.0;
            if (!std::isfinite(tick.price) || !std::isfinite(tick.qty)) {
                skipped++;
                continue;
            }
            ticks.push_back(tick);
        } catch (const std::exception&) {
            skipped++;
        }
    }

    if (skipped > 0) {
        LOG_WARN("{}: {} unparseable tick rows skipped", file_path, skipped);
    }
    LOG_INFO("Loaded {} ticks from {}", ticks.size(), file_path);
    return ticks;
}

std::vector<Bar> DataHistory::aggregateTicksTo1m(std::vector<Tick> ticks) {
    std::vector<Bar> bars;
    if (ticks.empty()) {
        return bars;
    }

    std::stable_sort(ticks.begin(), ticks.end(), [](const Tick& a, const Tick& b) {
        return a.timestamp < b.timestamp;
    });

    constexpr long long MINUTE_MS = 60 * 1000;
    auto minuteOf = [](long long ts) {
        long long bucket = ts / MINUTE_MS;
        if (ts < 0 && ts % MINUTE_MS != 0) bucket--;
        return bucket * MINUTE_MS;
    };

    Bar current;
    long long current_minute = minuteOf(ticks.front().timestamp);
    current = Bar(current_minute, ticks.front().price, ticks.front().price,
                  ticks.front().price, ticks.front().price, 0.0);

    for (const auto& tick : ticks) {
        const long long minute = minuteOf(tick.timestamp);
        if (minute != current_minute) {
            bars.push_back(current);
            current_minute = minute;
            current = Bar(minute, tick.price, tick.price, tick.price, tick.price, 0.0);
        }
        current.high = std::max(current.high, tick.price);
        current.low = std::min(current.low, tick.price);
        current.close = tick.price;
        current.volume += tick.qty;
    }
    bars.push_back(current);
    return bars;
}

std::vector<Bar> DataHistory::load(const BarFile& file) {
    switch (file.format) {
        case BarFileFormat::OHLCV_CSV:
            return loadCSV(file.path);
        case BarFileFormat::TICK_CSV: {
            LOG_INFO("Aggregating ticks -> 1m from {}", file.path);
            return aggregateTicksTo1m(loadTickCSV(file.path));
        }
        case BarFileFormat::OHLCV_JSON:
            return loadJSON(file.path);
    }
    return {};
}

std::vector<BarFile> DataHistory::candidateFiles(const std::string& inputs_dir,
                                                 const std::string& symbol,
                                                 const std::string& month) {
    const std::filesystem::path root(inputs_dir);
    const std::filesystem::path nested = root / symbol;
    const std::string tick_name = symbol + "-ticks-" + month + ".csv";
    const std::string csv_name = symbol + "-" + month + ".csv";
    const std::string json_name = symbol + "-" + month + ".json";

    return {
        {(root / tick_name).string(), BarFileFormat::TICK_CSV},
        {(nested / tick_name).string(), BarFileFormat::TICK_CSV},
        {(root / csv_name).string(), BarFileFormat::OHLCV_CSV},
        {(nested / csv_name).string(), BarFileFormat::OHLCV_CSV},
        {(root / json_name).string(), BarFileFormat::OHLCV_JSON},
        {(nested / json_name).string(), BarFileFormat::OHLCV_JSON},
    };
}

std::optional<BarFile> DataHistory::findMonthFile(const std::string& inputs_dir,
                                                  const std::string& symbol,
                                                  const std::string& month) {
    for (const auto& candidate : candidateFiles(inputs_dir, symbol, month)) {
        if (fileExists(candidate.path)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace backtest
} // namespace wavetrail
