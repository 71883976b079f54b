#include "kasa/device/DeviceSession.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <utility>

namespace kasa::device {

namespace {

using json = nlohmann::json;

constexpr const char* kBulbLightingModule = "smartlife.iot.smartbulb.lightingservice";
constexpr const char* kBulbEmeterModule = "smartlife.iot.common.emeter";
constexpr const char* kPlugEmeterModule = "emeter";

std::optional<std::string> stringField(const json& info, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = info.find(key);
        if (it != info.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

// Numbers outside the int range, or non-finite ones, read as absent.
std::optional<int> intField(const json& info, const char* key) {
    auto it = info.find(key);
    if (it == info.end() || !it->is_number()) {
        return std::nullopt;
    }
    const double value = it->get<double>();
    if (!std::isfinite(value) || value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

double roundTo(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

// Returns the method object of a {module: {method: {...}}} response, or nullptr.
const json* methodResult(const json& response, const std::string& module, const std::string& method) {
    auto moduleIt = response.find(module);
    if (moduleIt == response.end() || !moduleIt->is_object()) {
        return nullptr;
    }
    auto methodIt = moduleIt->find(method);
    if (methodIt == moduleIt->end() || !methodIt->is_object()) {
        return nullptr;
    }
    return &*methodIt;
}

bool accepted(const json& result) {
    auto it = result.find("err_code");
    if (it == result.end() || !it->is_number()) {
        return true;
    }
    return intField(result, "err_code") == 0;
}

std::optional<common::PowerState> powerFrom(const json& info) {
    if (auto relay = intField(info, "relay_state")) {
        return *relay != 0 ? common::PowerState::On : common::PowerState::Off;
    }
    if (auto light = info.find("light_state"); light != info.end() && light->is_object()) {
        if (auto onOff = intField(*light, "on_off")) {
            return *onOff != 0 ? common::PowerState::On : common::PowerState::Off;
        }
    }
    if (auto children = info.find("children"); children != info.end() && children->is_array() && !children->empty()) {
        const bool anyOn = std::any_of(children->begin(), children->end(), [](const json& child) {
            return child.is_object() && intField(child, "state").value_or(0) != 0;
        });
        return anyOn ? common::PowerState::On : common::PowerState::Off;
    }
    if (auto on = info.find("device_on"); on != info.end() && on->is_boolean()) {
        return on->get<bool>() ? common::PowerState::On : common::PowerState::Off;
    }
    return std::nullopt;
}

std::optional<int> brightnessFrom(const json& info) {
    if (auto level = intField(info, "brightness")) {
        return level;
    }
    if (intField(info, "is_dimmable").value_or(0) == 0) {
        return std::nullopt;
    }
    auto light = info.find("light_state");
    if (light == info.end() || !light->is_object()) {
        return std::nullopt;
    }
    if (auto level = intField(*light, "brightness")) {
        return level;
    }
    if (auto dft = light->find("dft_on_state"); dft != light->end() && dft->is_object()) {
        return intField(*dft, "brightness");
    }
    return std::nullopt;
}

}  // namespace

std::string callStatusName(CallStatus status) {
    switch (status) {
    case CallStatus::Ok:
        return "ok";
    case CallStatus::Unreachable:
        return "unreachable";
    case CallStatus::Unsupported:
        return "unsupported";
    case CallStatus::Rejected:
        return "rejected";
    }
    return "unknown";
}

std::optional<common::EnergyReading> normalizeEnergy(const json& realtime) {
    if (!realtime.is_object()) {
        return std::nullopt;
    }

    auto scaled = [&realtime](const char* milliKey, const char* baseKey, int decimals) -> std::optional<double> {
        if (auto it = realtime.find(milliKey); it != realtime.end() && it->is_number()) {
            return roundTo(it->get<double>() / 1000.0, decimals);
        }
        if (auto it = realtime.find(baseKey); it != realtime.end() && it->is_number()) {
            return it->get<double>();
        }
        return std::nullopt;
    };

    common::EnergyReading reading;
    reading.powerW = scaled("power_mw", "power", 2);
    reading.voltageV = scaled("voltage_mv", "voltage", 1);
    reading.currentA = scaled("current_ma", "current", 3);
    reading.totalKwh = scaled("total_wh", "total", 3);
    if (reading.empty()) {
        return std::nullopt;
    }
    return reading;
}

std::string deviceClass(const json& info) {
    const auto raw = toUpperCopy(stringField(info, {"type", "mic_type", "device_type"}).value_or(""));
    if (raw.empty()) {
        return "Unknown";
    }
    if (raw.find("BULB") != std::string::npos) {
        return info.contains("length") ? "LightStrip" : "Bulb";
    }
    if (raw.find("PLUG") != std::string::npos || raw.find("SWITCH") != std::string::npos) {
        if (auto children = info.find("children"); children != info.end() && children->is_array() && !children->empty()) {
            return "Strip";
        }
        if (info.contains("brightness")) {
            return "Dimmer";
        }
        return "Plug";
    }
    if (raw.find("HUB") != std::string::npos) {
        return "Hub";
    }
    if (raw.find("CAMERA") != std::string::npos) {
        return "Camera";
    }
    const auto dot = raw.find_last_of('.');
    return dot == std::string::npos ? raw : raw.substr(dot + 1);
}

DeviceSession::DeviceSession(discovery::DiscoveryReply reply, std::unique_ptr<DeviceChannel> channel)
    : address_(std::move(reply.address)),
      encoding_(reply.encoding),
      channel_(std::move(channel)) {
    type_ = "Unknown";
    applyInfo(reply.info);
}

DeviceSession::~DeviceSession() {
    try {
        release();
    } catch (const std::exception& ex) {
        spdlog::warn("Releasing session for {} failed: {}", address_, ex.what());
    }
}

std::string DeviceSession::name() const {
    std::lock_guard lock(mutex_);
    return name_;
}

common::PowerState DeviceSession::powerState() const {
    std::lock_guard lock(mutex_);
    return powerState_;
}

bool DeviceSession::degraded() const {
    std::lock_guard lock(mutex_);
    return degraded_;
}

bool DeviceSession::meteringCapable() const {
    std::lock_guard lock(mutex_);
    return metering_;
}

CallStatus DeviceSession::refresh() {
    std::lock_guard lock(mutex_);
    if (released_) {
        spdlog::warn("Refresh requested on released session for {}", address_);
        return CallStatus::Unreachable;
    }
    if (!channel_) {
        return CallStatus::Unsupported;
    }

    try {
        const json response = queryLocked({{"system", {{"get_sysinfo", json::object()}}}});
        const json* sysinfo = methodResult(response, "system", "get_sysinfo");
        if (sysinfo == nullptr || !accepted(*sysinfo)) {
            spdlog::warn("Device {} returned no usable sysinfo", address_);
            degraded_ = true;
            return CallStatus::Rejected;
        }

        std::optional<common::EnergyReading> energy = energy_;
        const bool metering = stringField(*sysinfo, {"feature"}).value_or("").find("ENE") != std::string::npos;
        if (metering) {
            const std::string cls = deviceClass(*sysinfo);
            if (auto reading = readEnergyLocked(cls == "Bulb" || cls == "LightStrip")) {
                energy = reading;
            }
        }

        applyInfo(*sysinfo);
        energy_ = energy;
        degraded_ = false;
        return CallStatus::Ok;
    } catch (const ChannelError& ex) {
        spdlog::warn("Refresh of {} failed: {}", address_, ex.what());
        degraded_ = true;
        return CallStatus::Unreachable;
    }
}

CallStatus DeviceSession::setPower(bool on) {
    std::lock_guard lock(mutex_);
    if (released_) {
        spdlog::warn("Power command on released session for {}", address_);
        return CallStatus::Unreachable;
    }
    if (!channel_) {
        return CallStatus::Unsupported;
    }

    const bool bulb = isBulbLocked();
    const std::string module = bulb ? kBulbLightingModule : "system";
    const std::string method = bulb ? "transition_light_state" : "set_relay_state";
    json params = bulb ? json{{"on_off", on ? 1 : 0}, {"ignore_default", 1}}
                       : json{{"state", on ? 1 : 0}};

    json response;
    try {
        response = queryLocked({{module, {{method, std::move(params)}}}});
    } catch (const ChannelError& ex) {
        spdlog::warn("Power command to {} failed: {}", address_, ex.what());
        return CallStatus::Unreachable;
    }

    const json* result = methodResult(response, module, method);
    if (result == nullptr || !accepted(*result)) {
        spdlog::warn("Device {} rejected {}.{}", address_, module, method);
        return CallStatus::Rejected;
    }

    powerState_ = on ? common::PowerState::On : common::PowerState::Off;
    return CallStatus::Ok;
}

std::optional<common::EnergyReading> DeviceSession::readEnergy() {
    std::lock_guard lock(mutex_);
    if (released_ || !channel_ || !metering_) {
        return std::nullopt;
    }
    try {
        auto reading = readEnergyLocked(isBulbLocked());
        if (reading) {
            energy_ = reading;
        }
        return reading;
    } catch (const ChannelError& ex) {
        spdlog::warn("Energy read from {} failed: {}", address_, ex.what());
        degraded_ = true;
        return std::nullopt;
    }
}

void DeviceSession::release() {
    std::lock_guard lock(mutex_);
    if (released_) {
        return;
    }
    released_ = true;
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

common::DeviceRecord DeviceSession::record(bool includeEnergy) const {
    std::lock_guard lock(mutex_);
    common::DeviceRecord out;
    out.name = name_;
    out.mac = mac_;
    out.ip = address_;
    out.model = model_;
    out.type = type_;
    out.powerState = powerState_;
    out.signalStrength = signalStrength_;
    out.brightness = brightness_;
    out.firmwareVersion = firmwareVersion_;
    if (includeEnergy && energy_) {
        out.energy = energy_;
    }
    return out;
}

void DeviceSession::applyInfo(const json& info) {
    if (!info.is_object()) {
        return;
    }
    if (auto alias = stringField(info, {"alias", "device_alias", "nickname"})) {
        name_ = *alias;
    }
    if (auto mac = stringField(info, {"mac", "mic_mac", "ethernet_mac"})) {
        mac_ = common::canonicalMac(*mac);
    }
    if (auto model = stringField(info, {"model", "device_model"})) {
        model_ = *model;
    }
    if (stringField(info, {"type", "mic_type", "device_type"})) {
        type_ = deviceClass(info);
    }
    if (auto power = powerFrom(info)) {
        powerState_ = *power;
    }
    if (auto rssi = intField(info, "rssi")) {
        signalStrength_ = rssi;
    }
    if (auto level = brightnessFrom(info)) {
        brightness_ = level;
    }
    if (auto firmware = stringField(info, {"sw_ver", "fw_ver"})) {
        firmwareVersion_ = *firmware;
    }
    if (auto feature = stringField(info, {"feature"})) {
        metering_ = feature->find("ENE") != std::string::npos;
    }
}

json DeviceSession::queryLocked(const json& request) {
    return channel_->query(request);
}

std::optional<common::EnergyReading> DeviceSession::readEnergyLocked(bool bulb) {
    const std::string module = bulb ? kBulbEmeterModule : kPlugEmeterModule;
    const json response = queryLocked({{module, {{"get_realtime", json::object()}}}});
    const json* realtime = methodResult(response, module, "get_realtime");
    if (realtime == nullptr || !accepted(*realtime)) {
        return std::nullopt;
    }
    return normalizeEnergy(*realtime);
}

bool DeviceSession::isBulbLocked() const {
    return type_ == "Bulb" || type_ == "LightStrip";
}

}  // namespace kasa::device
