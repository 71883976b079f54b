#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace kasa::common {

enum class PowerState {
    Unknown,
    Off,
    On,
};

struct EnergyReading {
    std::optional<double> powerW;
    std::optional<double> voltageV;
    std::optional<double> currentA;
    std::optional<double> totalKwh;

    bool empty() const {
        return !powerW && !voltageV && !currentA && !totalKwh;
    }
};

struct DeviceRecord {
    std::string name;
    std::string mac;
    std::string ip;
    std::string model;
    std::string type;
    PowerState powerState{PowerState::Unknown};
    std::optional<int> signalStrength;
    std::optional<int> brightness;
    std::optional<std::string> firmwareVersion;
    std::optional<EnergyReading> energy;
};

/**
 * @brief Canonical hardware address: uppercase hex pairs joined by ':'.
 *
 * Accepts ':', '-' and '.' separated or bare 12-digit forms. Input that does not
 * hold exactly 12 hex digits is returned trimmed and uppercased so the device is
 * still reported under a stable key.
 */
std::string canonicalMac(const std::string& mac);

std::string powerStateName(PowerState state);
std::string toLowerCopy(std::string value);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Name (case-insensitive), then MAC. Applied to every round before use.
void sortRecords(std::vector<DeviceRecord>& records);

void to_json(nlohmann::json& j, const DeviceRecord& record);
void from_json(const nlohmann::json& j, DeviceRecord& record);

}  // namespace kasa::common
