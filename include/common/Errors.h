#pragma once

#include <stdexcept>
#include <string>

namespace wavetrail {

// Malformed or out-of-order input bar. Recovered locally by skipping the bar.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or invalid configuration. Fatal for the affected symbol only.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Risk engine contract failure. Aborts the symbol's run.
class StateInvariantViolation : public std::logic_error {
public:
    explicit StateInvariantViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace wavetrail
