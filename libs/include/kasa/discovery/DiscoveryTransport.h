#pragma once

#include "kasa/protocol/WireCodec.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kasa::discovery {

struct DiscoveryReply {
    std::string address;
    std::uint16_t port{0};
    protocol::ReplyEncoding encoding{protocol::ReplyEncoding::Legacy};
    nlohmann::json info;
};

class DiscoveryTransport {
public:
    virtual ~DiscoveryTransport() = default;

    /**
     * @brief Run one discovery round.
     *
     * With @p targetIp set only that host is asked and the call returns as soon as
     * it answers. Otherwise every reply arriving within @p timeout is collected.
     * One reply per source address; the result is ordered by address. An empty
     * vector means nobody answered and is not an error.
     */
    virtual std::vector<DiscoveryReply> discover(std::chrono::milliseconds timeout,
                                                 const std::optional<std::string>& targetIp) = 0;
};

// Decodes raw datagrams and merges them by source address.
class ReplyCollector {
public:
    // Returns false when the payload matched neither encoding; the datagram is dropped.
    bool accept(const std::string& address, std::uint16_t port, const protocol::Bytes& payload);

    bool contains(const std::string& address) const;
    std::size_t size() const noexcept { return replies_.size(); }
    std::size_t dropped() const noexcept { return dropped_; }

    std::vector<DiscoveryReply> take();

private:
    std::map<std::string, DiscoveryReply> replies_;
    std::size_t dropped_{0};
};

// Orders dotted-quad addresses numerically; anything else sorts after, lexically.
bool addressLess(const std::string& a, const std::string& b);

}  // namespace kasa::discovery
