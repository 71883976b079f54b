#pragma once

#include <nlohmann/json.hpp>

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace kasa::discovery {
struct DiscoveryReply;
}

namespace kasa::device {

// The device could not be reached or answered with something unreadable.
class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& what) : std::runtime_error(what) {}
};

class DeviceChannel {
public:
    virtual ~DeviceChannel() = default;

    // Sends one command object and returns the device's response object.
    virtual nlohmann::json query(const nlohmann::json& request) = 0;
    virtual void close() = 0;
};

class TcpDeviceChannel : public DeviceChannel {
public:
    TcpDeviceChannel(std::string host, std::uint16_t port, std::chrono::milliseconds timeout);
    ~TcpDeviceChannel() override;

    TcpDeviceChannel(const TcpDeviceChannel&) = delete;
    TcpDeviceChannel& operator=(const TcpDeviceChannel&) = delete;

    nlohmann::json query(const nlohmann::json& request) override;
    void close() override;

private:
    void ensureConnected();
    void runFor(const char* step);
    void fail(const std::string& step, const std::error_code& ec);

    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_;
    asio::io_context ioContext_;
    asio::ip::tcp::socket socket_;
};

using ChannelFactory =
    std::function<std::unique_ptr<DeviceChannel>(const discovery::DiscoveryReply& reply)>;

ChannelFactory tcpChannelFactory(std::uint16_t commandPort, std::chrono::milliseconds timeout);

}  // namespace kasa::device
