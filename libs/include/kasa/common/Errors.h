#pragma once

#include <stdexcept>
#include <string>

namespace kasa::common {

// No usable socket or network interface. Aborts the round.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Baseline, snapshot or scan log could not be written or read back.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace kasa::common
