#pragma once

#include "kasa/common/DeviceRecord.h"
#include "kasa/device/DeviceChannel.h"
#include "kasa/device/DeviceSession.h"
#include "kasa/discovery/DiscoveryTransport.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kasa::discovery {

using SessionList = std::vector<std::unique_ptr<device::DeviceSession>>;

// One discovery round: broadcast, open a session per reply, refresh them with bounded fan-out.
class DeviceScanner {
public:
    DeviceScanner(DiscoveryTransport& transport,
                  device::ChannelFactory channelFactory,
                  std::size_t maxParallel);

    // Sessions come back refreshed (or degraded), ordered by address. The caller owns them.
    SessionList openSessions(std::chrono::milliseconds timeout,
                             const std::optional<std::string>& targetIp = std::nullopt);

    // Full round reduced to records. Every session is released before returning.
    std::vector<common::DeviceRecord> scan(std::chrono::milliseconds timeout,
                                           const std::optional<std::string>& targetIp,
                                           bool includeEnergy);

private:
    void refreshAll(SessionList& sessions) const;

    DiscoveryTransport& transport_;
    device::ChannelFactory channelFactory_;
    std::size_t maxParallel_;
};

}  // namespace kasa::discovery
