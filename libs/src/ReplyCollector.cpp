#include "kasa/discovery/DiscoveryTransport.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace kasa::discovery {

namespace {

std::optional<std::array<unsigned, 4>> parseDottedQuad(const std::string& address) {
    std::array<unsigned, 4> octets{};
    std::size_t index = 0;
    unsigned value = 0;
    std::size_t digits = 0;
    for (char c : address) {
        if (c == '.') {
            if (digits == 0 || index >= 3) {
                return std::nullopt;
            }
            octets[index++] = value;
            value = 0;
            digits = 0;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)) || digits >= 3) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
        ++digits;
    }
    if (digits == 0 || index != 3 || value > 255) {
        return std::nullopt;
    }
    octets[index] = value;
    if (std::any_of(octets.begin(), octets.end(), [](unsigned octet) { return octet > 255; })) {
        return std::nullopt;
    }
    return octets;
}

}  // namespace

bool addressLess(const std::string& a, const std::string& b) {
    const auto quadA = parseDottedQuad(a);
    const auto quadB = parseDottedQuad(b);
    if (quadA && quadB) {
        return *quadA < *quadB;
    }
    if (quadA || quadB) {
        return quadA.has_value();
    }
    return a < b;
}

bool ReplyCollector::accept(const std::string& address,
                            std::uint16_t port,
                            const protocol::Bytes& payload) {
    auto decoded = protocol::decodeDiscoveryReply(payload);
    if (!decoded) {
        ++dropped_;
        spdlog::debug("Dropping undecodable reply from {}:{} ({} bytes)", address, port, payload.size());
        return false;
    }

    auto it = replies_.find(address);
    if (it != replies_.end()) {
        spdlog::debug("Replacing earlier reply from {} with reply on port {}", address, port);
    }
    replies_[address] = DiscoveryReply{address, port, decoded->encoding, std::move(decoded->info)};
    return true;
}

bool ReplyCollector::contains(const std::string& address) const {
    return replies_.find(address) != replies_.end();
}

std::vector<DiscoveryReply> ReplyCollector::take() {
    std::vector<DiscoveryReply> out;
    out.reserve(replies_.size());
    for (auto& [address, reply] : replies_) {
        out.push_back(std::move(reply));
    }
    replies_.clear();
    std::sort(out.begin(), out.end(), [](const DiscoveryReply& a, const DiscoveryReply& b) {
        return addressLess(a.address, b.address);
    });
    return out;
}

}  // namespace kasa::discovery
