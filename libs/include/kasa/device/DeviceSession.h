#pragma once

#include "kasa/common/DeviceRecord.h"
#include "kasa/device/DeviceChannel.h"
#include "kasa/discovery/DiscoveryTransport.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kasa::device {

enum class CallStatus {
    Ok,
    Unreachable,
    Unsupported,
    Rejected,
};

std::string callStatusName(CallStatus status);

/**
 * @brief Convert a get_realtime payload to watts, volts, amps and kWh.
 *
 * Older firmware reports power_mw, voltage_mv, current_ma and total_wh; newer
 * firmware reports power, voltage, current and total in base units. Milli-units
 * take precedence when both are present. Returns std::nullopt when the payload
 * holds none of the fields.
 */
std::optional<common::EnergyReading> normalizeEnergy(const nlohmann::json& realtime);

// "IOT.SMARTPLUGSWITCH" -> "Plug", "SMART.TAPOBULB" -> "Bulb", ...
std::string deviceClass(const nlohmann::json& info);

class DeviceSession {
public:
    DeviceSession(discovery::DiscoveryReply reply, std::unique_ptr<DeviceChannel> channel);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    const std::string& address() const noexcept { return address_; }
    protocol::ReplyEncoding encoding() const noexcept { return encoding_; }
    std::string name() const;
    common::PowerState powerState() const;
    bool degraded() const;
    bool meteringCapable() const;

    CallStatus refresh();
    CallStatus setPower(bool on);
    std::optional<common::EnergyReading> readEnergy();
    void release();

    common::DeviceRecord record(bool includeEnergy) const;

private:
    void applyInfo(const nlohmann::json& info);
    nlohmann::json queryLocked(const nlohmann::json& request);
    std::optional<common::EnergyReading> readEnergyLocked(bool bulb);
    bool isBulbLocked() const;

    const std::string address_;
    const protocol::ReplyEncoding encoding_;

    mutable std::mutex mutex_;
    std::unique_ptr<DeviceChannel> channel_;
    bool released_{false};
    bool degraded_{false};

    std::string name_;
    std::string mac_;
    std::string model_;
    std::string type_;
    common::PowerState powerState_{common::PowerState::Unknown};
    std::optional<int> signalStrength_;
    std::optional<int> brightness_;
    std::optional<std::string> firmwareVersion_;
    bool metering_{false};
    std::optional<common::EnergyReading> energy_;
};

}  // namespace kasa::device
