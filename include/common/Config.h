#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace wavetrail {

// Run configuration loaded from a JSON document.
// Symbol parameters are resolved lazily per symbol so that one bad
// symbol section does not prevent the others from running.
class Config {
public:
    Config() = default;

    // Throws ConfigError when the file is missing or not valid JSON.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& document);

    // Throws ConfigError on a missing required key or an invalid value.
    engine::SymbolConfig resolveSymbol(const std::string& symbol) const;

    std::string getInputsDir() const { return inputs_dir_; }
    std::string getOutputsDir() const { return outputs_dir_; }
    std::string getLogsDir() const { return logs_dir_; }
    std::string getLogLevel() const { return log_level_; }
    std::vector<std::string> getSymbols() const { return symbols_; }
    std::vector<std::string> getMonths() const { return months_; }

    void setSymbols(const std::vector<std::string>& v) { symbols_ = v; }
    void setMonths(const std::vector<std::string>& v) { months_ = v; }

private:
    nlohmann::json document_ = nlohmann::json::object();

    std::string inputs_dir_ = "inputs";
    std::string outputs_dir_ = "outputs";
    std::string logs_dir_ = "logs";
    std::string log_level_ = "info";
    std::vector<std::string> symbols_;
    std::vector<std::string> months_;
};

} // namespace wavetrail
