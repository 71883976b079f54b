#include "kasa/common/DeviceRecord.h"

#include <algorithm>
#include <cctype>

namespace kasa::common {

namespace {

using json = nlohmann::json;

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> getOptional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::string trimCopy(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

std::string canonicalMac(const std::string& mac) {
    std::string digits;
    digits.reserve(12);
    bool wellFormed = true;
    for (char c : mac) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            wellFormed = false;
            break;
        }
        digits.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (!wellFormed || digits.size() != 12) {
        std::string fallback = trimCopy(mac);
        std::transform(fallback.begin(), fallback.end(), fallback.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });
        return fallback;
    }

    std::string out;
    out.reserve(17);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        if (!out.empty()) {
            out.push_back(':');
        }
        out.append(digits, i, 2);
    }
    return out;
}

std::string powerStateName(PowerState state) {
    switch (state) {
    case PowerState::On:
        return "ON";
    case PowerState::Off:
        return "OFF";
    case PowerState::Unknown:
        break;
    }
    return "UNKNOWN";
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLowerCopy(haystack).find(toLowerCopy(needle)) != std::string::npos;
}

void sortRecords(std::vector<DeviceRecord>& records) {
    std::sort(records.begin(), records.end(), [](const DeviceRecord& a, const DeviceRecord& b) {
        const auto nameA = toLowerCopy(a.name);
        const auto nameB = toLowerCopy(b.name);
        if (nameA != nameB) {
            return nameA < nameB;
        }
        return a.mac < b.mac;
    });
}

void to_json(json& j, const DeviceRecord& record) {
    j = json::object();
    j["name"] = record.name;
    j["mac"] = record.mac;
    j["ip"] = record.ip;
    j["model"] = record.model;
    j["type"] = record.type;
    if (record.powerState == PowerState::Unknown) {
        j["is_on"] = nullptr;
    } else {
        j["is_on"] = record.powerState == PowerState::On;
    }
    putOptional(j, "rssi", record.signalStrength);
    putOptional(j, "brightness", record.brightness);
    putOptional(j, "firmware", record.firmwareVersion);
    if (record.energy.has_value()) {
        putOptional(j, "power_w", record.energy->powerW);
        putOptional(j, "voltage_v", record.energy->voltageV);
        putOptional(j, "current_a", record.energy->currentA);
        putOptional(j, "total_kwh", record.energy->totalKwh);
    }
}

void from_json(const json& j, DeviceRecord& record) {
    record.name = j.value("name", "");
    record.mac = canonicalMac(j.at("mac").get<std::string>());
    record.ip = j.value("ip", "");
    record.model = j.value("model", "");
    record.type = j.value("type", "");

    record.powerState = PowerState::Unknown;
    if (auto isOn = getOptional<bool>(j, "is_on")) {
        record.powerState = *isOn ? PowerState::On : PowerState::Off;
    }
    record.signalStrength = getOptional<int>(j, "rssi");
    record.brightness = getOptional<int>(j, "brightness");
    record.firmwareVersion = getOptional<std::string>(j, "firmware");

    EnergyReading energy;
    energy.powerW = getOptional<double>(j, "power_w");
    energy.voltageV = getOptional<double>(j, "voltage_v");
    energy.currentA = getOptional<double>(j, "current_a");
    energy.totalKwh = getOptional<double>(j, "total_kwh");
    if (!energy.empty()) {
        record.energy = energy;
    } else {
        record.energy.reset();
    }
}

}  // namespace kasa::common
