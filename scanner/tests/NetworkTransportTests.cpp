#include "TestSupport.h"

#include "kasa/common/Errors.h"
#include "kasa/device/DeviceChannel.h"
#include "kasa/discovery/UdpDiscoveryTransport.h"
#include "kasa/protocol/WireCodec.h"

#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using kasa::protocol::Bytes;
using nlohmann::json;
using udp = asio::ip::udp;
using tcp = asio::ip::tcp;

namespace {

using Clock = std::chrono::steady_clock;

// Answers datagrams on an ephemeral loopback port from a worker thread.
class UdpResponder {
public:
    using Answer = std::function<std::optional<Bytes>(const Bytes& datagram, const udp::endpoint& sender)>;

    explicit UdpResponder(Answer answer)
        : socket_(ioContext_, udp::endpoint(asio::ip::address_v4::loopback(), 0)), answer_(std::move(answer)) {
        receive();
        worker_ = std::thread([this] { ioContext_.run_for(std::chrono::seconds(10)); });
    }

    ~UdpResponder() {
        ioContext_.stop();
        worker_.join();
    }

    UdpResponder(const UdpResponder&) = delete;
    UdpResponder& operator=(const UdpResponder&) = delete;

    std::uint16_t port() const {
        return socket_.local_endpoint().port();
    }

    std::vector<Bytes> received() {
        std::lock_guard lock(mutex_);
        return received_;
    }

private:
    void receive() {
        socket_.async_receive_from(asio::buffer(buffer_), sender_, [this](std::error_code ec, std::size_t size) {
            if (ec) {
                return;
            }
            Bytes datagram(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size));
            {
                std::lock_guard lock(mutex_);
                received_.push_back(datagram);
            }
            if (answer_) {
                if (auto reply = answer_(datagram, sender_)) {
                    std::error_code ignored;
                    socket_.send_to(asio::buffer(*reply), sender_, 0, ignored);
                }
            }
            receive();
        });
    }

    asio::io_context ioContext_;
    udp::socket socket_;
    Answer answer_;
    std::array<std::uint8_t, 2048> buffer_{};
    udp::endpoint sender_;
    std::mutex mutex_;
    std::vector<Bytes> received_;
    std::thread worker_;
};

UdpResponder::Answer answerLegacy(const json& sysinfo) {
    return [payload = kasa::test::legacyPayload(sysinfo)](const Bytes& datagram,
                                                         const udp::endpoint&) -> std::optional<Bytes> {
        if (datagram != kasa::protocol::legacyDiscoveryRequest()) {
            return std::nullopt;
        }
        return payload;
    };
}

// Accepts one connection on an ephemeral loopback port and runs a session on it.
class TcpResponder {
public:
    using Session = std::function<void(tcp::socket&)>;

    explicit TcpResponder(Session session)
        : acceptor_(ioContext_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)) {
        worker_ = std::thread([this, session = std::move(session)] {
            tcp::socket socket(ioContext_);
            std::error_code ec;
            acceptor_.accept(socket, ec);
            if (!ec) {
                session(socket);
            }
        });
    }

    ~TcpResponder() {
        worker_.join();
    }

    TcpResponder(const TcpResponder&) = delete;
    TcpResponder& operator=(const TcpResponder&) = delete;

    std::uint16_t port() const {
        return acceptor_.local_endpoint().port();
    }

private:
    asio::io_context ioContext_;
    tcp::acceptor acceptor_;
    std::thread worker_;
};

std::optional<json> readRequest(tcp::socket& socket) {
    std::array<std::uint8_t, kasa::protocol::kFrameHeaderSize> header{};
    std::error_code ec;
    asio::read(socket, asio::buffer(header), ec);
    if (ec) {
        return std::nullopt;
    }
    Bytes body(kasa::protocol::frameLength(header));
    asio::read(socket, asio::buffer(body), ec);
    if (ec) {
        return std::nullopt;
    }
    try {
        return kasa::protocol::decodeFrameBody(body);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Blocks until the peer closes the connection.
void waitForClose(tcp::socket& socket) {
    std::array<std::uint8_t, 64> sink{};
    std::error_code ec;
    while (!ec) {
        socket.read_some(asio::buffer(sink), ec);
    }
}

void writeHeader(tcp::socket& socket, std::uint32_t length) {
    const std::array<std::uint8_t, kasa::protocol::kFrameHeaderSize> header{
        static_cast<std::uint8_t>(length >> 24),
        static_cast<std::uint8_t>(length >> 16),
        static_cast<std::uint8_t>(length >> 8),
        static_cast<std::uint8_t>(length),
    };
    std::error_code ignored;
    asio::write(socket, asio::buffer(header), ignored);
}

std::uint16_t unusedTcpPort() {
    asio::io_context ioContext;
    tcp::acceptor acceptor(ioContext, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    return acceptor.local_endpoint().port();
}

const json kSysinfoRequest = {{"system", {{"get_sysinfo", json::object()}}}};

}  // namespace

TEST_CASE("Unicast discovery returns on the first decoded reply", "[transport]") {
    UdpResponder responder(answerLegacy(kasa::test::plugSysinfo("Loopback Plug", "50:C7:BF:00:01:01", 1)));
    kasa::discovery::UdpDiscoveryTransport transport("255.255.255.255", {responder.port()});

    const auto started = Clock::now();
    const auto replies = transport.discover(std::chrono::seconds(5), std::string("127.0.0.1"));
    const auto elapsed = Clock::now() - started;

    REQUIRE(replies.size() == 1);
    CHECK(replies.front().address == "127.0.0.1");
    CHECK(replies.front().port == responder.port());
    CHECK(replies.front().encoding == kasa::protocol::ReplyEncoding::Legacy);
    CHECK(replies.front().info.at("alias") == "Loopback Plug");
    CHECK(elapsed < std::chrono::seconds(2));

    const auto received = responder.received();
    REQUIRE_FALSE(received.empty());
    CHECK(received.front() == kasa::protocol::legacyDiscoveryRequest());
}

TEST_CASE("Discovery waits out the deadline when nobody answers", "[transport]") {
    UdpResponder responder(nullptr);
    kasa::discovery::UdpDiscoveryTransport transport("255.255.255.255", {responder.port()});

    const auto started = Clock::now();
    const auto replies = transport.discover(std::chrono::milliseconds(200), std::string("127.0.0.1"));
    const auto elapsed = Clock::now() - started;

    CHECK(replies.empty());
    CHECK(elapsed >= std::chrono::milliseconds(190));
    CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("Unicast discovery ignores replies from other hosts", "[transport]") {
    asio::io_context decoyContext;
    udp::socket decoy(decoyContext, udp::endpoint(asio::ip::make_address_v4("127.0.0.2"), 0));
    const auto decoyPayload = kasa::test::legacyPayload(kasa::test::plugSysinfo("Impostor", "50:C7:BF:00:01:99", 0));
    const auto realPayload = kasa::test::legacyPayload(kasa::test::plugSysinfo("Real Plug", "50:C7:BF:00:01:02", 0));

    UdpResponder responder([&](const Bytes& datagram, const udp::endpoint& sender) -> std::optional<Bytes> {
        if (datagram != kasa::protocol::legacyDiscoveryRequest()) {
            return std::nullopt;
        }
        std::error_code ignored;
        decoy.send_to(asio::buffer(decoyPayload), sender, 0, ignored);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return realPayload;
    });
    kasa::discovery::UdpDiscoveryTransport transport("255.255.255.255", {responder.port()});

    const auto replies = transport.discover(std::chrono::seconds(5), std::string("127.0.0.1"));

    REQUIRE(replies.size() == 1);
    CHECK(replies.front().address == "127.0.0.1");
    CHECK(replies.front().info.at("alias") == "Real Plug");
}

TEST_CASE("A failed send does not stop the remaining ports", "[transport]") {
    UdpResponder responder(answerLegacy(kasa::test::plugSysinfo("Second Port", "50:C7:BF:00:01:03", 0)));
    // Port 0 is rejected by the kernel on send.
    kasa::discovery::UdpDiscoveryTransport transport("255.255.255.255", {0, responder.port()});

    const auto replies = transport.discover(std::chrono::seconds(5), std::string("127.0.0.1"));

    REQUIRE(replies.size() == 1);
    CHECK(replies.front().info.at("alias") == "Second Port");
    CHECK(responder.received().size() >= 1);
}

TEST_CASE("Broadcast-mode discovery collects until the deadline", "[transport]") {
    UdpResponder responder(answerLegacy(kasa::test::plugSysinfo("Everyone", "50:C7:BF:00:01:04", 1)));
    kasa::discovery::UdpDiscoveryTransport transport("127.0.0.1", {responder.port()});

    const auto started = Clock::now();
    const auto replies = transport.discover(std::chrono::milliseconds(300), std::nullopt);
    const auto elapsed = Clock::now() - started;

    REQUIRE(replies.size() == 1);
    CHECK(replies.front().info.at("alias") == "Everyone");
    CHECK(elapsed >= std::chrono::milliseconds(290));
}

TEST_CASE("Discovery rejects unusable addresses", "[transport]") {
    CHECK_THROWS_AS(kasa::discovery::UdpDiscoveryTransport("255.255.255.255", {}), kasa::common::TransportError);

    kasa::discovery::UdpDiscoveryTransport transport("not-an-address", {9999});
    CHECK(transport.discover(std::chrono::milliseconds(10), std::string("192.168.1.300")).empty());
    CHECK_THROWS_AS(transport.discover(std::chrono::milliseconds(10), std::nullopt), kasa::common::TransportError);
}

TEST_CASE("TCP channel exchanges length-prefixed frames", "[transport]") {
    TcpResponder responder([](tcp::socket& socket) {
        while (auto request = readRequest(socket)) {
            const json response = {{"system", {{"get_sysinfo", {{"alias", "Framed"}, {"echo", *request}}}}}};
            const auto frame = kasa::protocol::frameCommand(response);
            std::error_code ec;
            asio::write(socket, asio::buffer(frame), ec);
            if (ec) {
                return;
            }
        }
    });
    kasa::device::TcpDeviceChannel channel("127.0.0.1", responder.port(), std::chrono::seconds(2));

    const auto first = channel.query(kSysinfoRequest);
    CHECK(first.at("system").at("get_sysinfo").at("alias") == "Framed");
    CHECK(first.at("system").at("get_sysinfo").at("echo") == kSysinfoRequest);

    const json relay = {{"system", {{"set_relay_state", {{"state", 1}}}}}};
    const auto second = channel.query(relay);
    CHECK(second.at("system").at("get_sysinfo").at("echo") == relay);

    channel.close();
}

TEST_CASE("TCP channel rejects implausible response lengths", "[transport]") {
    SECTION("over the 1 MiB cap") {
        TcpResponder responder([](tcp::socket& socket) {
            if (readRequest(socket)) {
                writeHeader(socket, (1U << 20) + 1);
                waitForClose(socket);
            }
        });
        kasa::device::TcpDeviceChannel channel("127.0.0.1", responder.port(), std::chrono::seconds(2));
        CHECK_THROWS_AS(channel.query(kSysinfoRequest), kasa::device::ChannelError);
    }

    SECTION("zero length") {
        TcpResponder responder([](tcp::socket& socket) {
            if (readRequest(socket)) {
                writeHeader(socket, 0);
                waitForClose(socket);
            }
        });
        kasa::device::TcpDeviceChannel channel("127.0.0.1", responder.port(), std::chrono::seconds(2));
        CHECK_THROWS_AS(channel.query(kSysinfoRequest), kasa::device::ChannelError);
    }
}

TEST_CASE("TCP channel times out on a silent device", "[transport]") {
    TcpResponder responder([](tcp::socket& socket) {
        if (readRequest(socket)) {
            waitForClose(socket);
        }
    });
    kasa::device::TcpDeviceChannel channel("127.0.0.1", responder.port(), std::chrono::milliseconds(200));

    const auto started = Clock::now();
    CHECK_THROWS_AS(channel.query(kSysinfoRequest), kasa::device::ChannelError);
    const auto elapsed = Clock::now() - started;

    CHECK(elapsed >= std::chrono::milliseconds(190));
    CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("TCP channel reports a refused connection", "[transport]") {
    kasa::device::TcpDeviceChannel channel("127.0.0.1", unusedTcpPort(), std::chrono::seconds(2));
    CHECK_THROWS_AS(channel.query(kSysinfoRequest), kasa::device::ChannelError);
}
