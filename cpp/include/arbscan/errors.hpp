#pragma once

#include <stdexcept>
#include <string>

namespace arbscan {

class ArbscanError : public std::runtime_error {
public:
    explicit ArbscanError(const std::string& msg) : std::runtime_error(msg) {}
};

// Journal open/append/rewrite/replay failures
class StorageError : public ArbscanError {
public:
    explicit StorageError(const std::string& msg) : ArbscanError("Storage error: " + msg) {}
};

class ConfigError : public ArbscanError {
public:
    explicit ConfigError(const std::string& msg) : ArbscanError("Config error: " + msg) {}
};

// Malformed date keys, zero limits, negative durations
class QueryError : public ArbscanError {
public:
    explicit QueryError(const std::string& msg) : ArbscanError("Query error: " + msg) {}
};

} // namespace arbscan
