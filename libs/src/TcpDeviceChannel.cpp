#include "kasa/device/DeviceChannel.h"

#include "kasa/discovery/DiscoveryTransport.h"
#include "kasa/protocol/WireCodec.h"

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace kasa::device {

namespace {

constexpr std::uint32_t kMaxResponseBytes = 1U << 20;

}  // namespace

TcpDeviceChannel::TcpDeviceChannel(std::string host, std::uint16_t port, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout), socket_(ioContext_) {}

TcpDeviceChannel::~TcpDeviceChannel() {
    close();
}

void TcpDeviceChannel::close() {
    if (!socket_.is_open()) {
        return;
    }
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    spdlog::debug("Closed connection to {}:{}", host_, port_);
}

nlohmann::json TcpDeviceChannel::query(const nlohmann::json& request) {
    ensureConnected();

    const protocol::Bytes frame = protocol::frameCommand(request);
    std::error_code ec = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(frame), [&ec](std::error_code result, std::size_t) {
        ec = result;
    });
    runFor("send");
    if (ec) {
        fail("send", ec);
    }

    std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
    ec = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(header), [&ec](std::error_code result, std::size_t) {
        ec = result;
    });
    runFor("read");
    if (ec) {
        fail("read", ec);
    }

    const std::uint32_t length = protocol::frameLength(header);
    if (length == 0 || length > kMaxResponseBytes) {
        close();
        throw ChannelError("Implausible response length " + std::to_string(length) + " from " + host_);
    }

    protocol::Bytes body(length);
    ec = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(body), [&ec](std::error_code result, std::size_t) {
        ec = result;
    });
    runFor("read");
    if (ec) {
        fail("read", ec);
    }

    try {
        return protocol::decodeFrameBody(body);
    } catch (const std::runtime_error& ex) {
        close();
        throw ChannelError(std::string(ex.what()) + " from " + host_);
    }
}

void TcpDeviceChannel::ensureConnected() {
    if (socket_.is_open()) {
        return;
    }

    std::error_code ec;
    const auto address = asio::ip::make_address_v4(host_, ec);
    if (ec) {
        throw ChannelError("Invalid device address '" + host_ + "': " + ec.message());
    }

    ec = asio::error::would_block;
    socket_.async_connect(asio::ip::tcp::endpoint(address, port_), [&ec](std::error_code result) {
        ec = result;
    });
    runFor("connect");
    if (ec) {
        fail("connect", ec);
    }
    spdlog::debug("Connected to {}:{}", host_, port_);
}

void TcpDeviceChannel::runFor(const char* step) {
    ioContext_.restart();
    ioContext_.run_for(timeout_);
    if (!ioContext_.stopped()) {
        std::error_code ignored;
        socket_.close(ignored);
        ioContext_.run();
        throw ChannelError(std::string(step) + " " + host_ + " timed out");
    }
}

void TcpDeviceChannel::fail(const std::string& step, const std::error_code& ec) {
    close();
    throw ChannelError(step + " " + host_ + " failed: " + ec.message());
}

ChannelFactory tcpChannelFactory(std::uint16_t commandPort, std::chrono::milliseconds timeout) {
    return [commandPort, timeout](const discovery::DiscoveryReply& reply) -> std::unique_ptr<DeviceChannel> {
        if (reply.encoding != protocol::ReplyEncoding::Legacy) {
            return nullptr;
        }
        return std::make_unique<TcpDeviceChannel>(reply.address, commandPort, timeout);
    };
}

}  // namespace kasa::device
