#include "kasa/discovery/UdpDiscoveryTransport.h"

#include "kasa/common/Errors.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace kasa::discovery {

class UdpDiscoveryTransport::Round {
public:
    explicit Round(std::optional<std::string> target)
        : socket_(ioContext_), timer_(ioContext_), target_(std::move(target)) {
        std::error_code ec;
        socket_.open(asio::ip::udp::v4(), ec);
        if (ec) {
            throw common::TransportError("Failed to open discovery socket: " + ec.message());
        }
        socket_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            spdlog::debug("reuse_address not available: {}", ec.message());
        }
        if (!target_) {
            socket_.set_option(asio::socket_base::broadcast(true), ec);
            if (ec) {
                throw common::TransportError("Failed to enable broadcast: " + ec.message());
            }
        }
        socket_.bind(Endpoint(asio::ip::address_v4::any(), 0), ec);
        if (ec) {
            throw common::TransportError("Failed to bind discovery socket: " + ec.message());
        }
    }

    ~Round() {
        std::error_code ec;
        socket_.close(ec);
    }

    Round(const Round&) = delete;
    Round& operator=(const Round&) = delete;

    bool send(const Endpoint& destination, const protocol::Bytes& payload) {
        std::error_code ec;
        socket_.send_to(asio::buffer(payload), destination, 0, ec);
        if (ec) {
            spdlog::warn("Discovery request to {}:{} failed: {}",
                         destination.address().to_string(),
                         destination.port(),
                         ec.message());
            return false;
        }
        return true;
    }

    std::vector<DiscoveryReply> collect(std::chrono::milliseconds timeout) {
        timer_.expires_after(timeout);
        timer_.async_wait([this](std::error_code ec) {
            if (!ec) {
                finish();
            }
        });
        issueReceive();
        ioContext_.run();

        spdlog::debug("Discovery round finished: {} repl{}, {} dropped",
                      collector_.size(),
                      collector_.size() == 1 ? "y" : "ies",
                      collector_.dropped());
        return collector_.take();
    }

private:
    void issueReceive() {
        socket_.async_receive_from(
            asio::buffer(buffer_),
            remoteEndpoint_,
            [this](std::error_code ec, std::size_t bytesReceived) {
                handleReceive(ec, bytesReceived);
            });
    }

    void handleReceive(std::error_code ec, std::size_t bytesReceived) {
        if (done_) {
            return;
        }
        if (ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            spdlog::debug("Discovery receive error: {}", ec.message());
            issueReceive();
            return;
        }

        const auto address = remoteEndpoint_.address().to_string();
        if (target_ && address != *target_) {
            spdlog::debug("Ignoring reply from {} while waiting for {}", address, *target_);
            issueReceive();
            return;
        }

        protocol::Bytes payload(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(bytesReceived));
        const bool decoded = collector_.accept(address, remoteEndpoint_.port(), payload);
        if (decoded && target_) {
            finish();
            return;
        }
        issueReceive();
    }

    void finish() {
        if (done_) {
            return;
        }
        done_ = true;
        timer_.cancel();
        std::error_code ec;
        socket_.cancel(ec);
    }

    asio::io_context ioContext_;
    asio::ip::udp::socket socket_;
    asio::steady_timer timer_;
    std::optional<std::string> target_;
    std::array<std::uint8_t, 8192> buffer_{};
    Endpoint remoteEndpoint_{};
    ReplyCollector collector_;
    bool done_{false};
};

UdpDiscoveryTransport::UdpDiscoveryTransport(std::string broadcastAddress, std::vector<std::uint16_t> ports)
    : broadcastAddress_(std::move(broadcastAddress)), ports_(std::move(ports)) {
    if (ports_.empty()) {
        throw common::TransportError("At least one discovery port is required");
    }
}

std::vector<DiscoveryReply> UdpDiscoveryTransport::discover(std::chrono::milliseconds timeout,
                                                            const std::optional<std::string>& targetIp) {
    std::error_code ec;
    asio::ip::address_v4 destination;
    if (targetIp) {
        destination = asio::ip::make_address_v4(*targetIp, ec);
        if (ec) {
            spdlog::warn("Invalid device address '{}': {}", *targetIp, ec.message());
            return {};
        }
    } else {
        destination = asio::ip::make_address_v4(broadcastAddress_, ec);
        if (ec) {
            throw common::TransportError("Invalid broadcast address '" + broadcastAddress_ + "': " + ec.message());
        }
    }

    std::optional<std::string> target;
    if (targetIp) {
        target = destination.to_string();
    }
    Round round(target);

    const std::array<protocol::Bytes, 2> requests{
        protocol::legacyDiscoveryRequest(),
        protocol::structuredDiscoveryRequest(),
    };

    std::size_t sent = 0;
    for (std::uint16_t port : ports_) {
        for (const auto& request : requests) {
            if (round.send(Endpoint(destination, port), request)) {
                ++sent;
            }
        }
    }
    if (sent == 0) {
        spdlog::warn("No discovery request could be sent to {}", destination.to_string());
        return {};
    }

    spdlog::debug("Sent {} discovery request(s) to {}, waiting {} ms",
                  sent,
                  destination.to_string(),
                  timeout.count());
    return round.collect(timeout);
}

}  // namespace kasa::discovery
