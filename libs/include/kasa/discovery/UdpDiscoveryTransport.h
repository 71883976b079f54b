#pragma once

#include "kasa/discovery/DiscoveryTransport.h"

#include <asio.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace kasa::discovery {

class UdpDiscoveryTransport : public DiscoveryTransport {
public:
    UdpDiscoveryTransport(std::string broadcastAddress, std::vector<std::uint16_t> ports);

    std::vector<DiscoveryReply> discover(std::chrono::milliseconds timeout,
                                         const std::optional<std::string>& targetIp) override;

private:
    using Endpoint = asio::ip::udp::endpoint;

    class Round;

    std::string broadcastAddress_;
    std::vector<std::uint16_t> ports_;
};

}  // namespace kasa::discovery
