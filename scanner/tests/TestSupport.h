#pragma once

#include "kasa/device/DeviceChannel.h"
#include "kasa/discovery/DiscoveryTransport.h"
#include "kasa/protocol/WireCodec.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kasa::test {

using json = nlohmann::json;

inline json plugSysinfo(const std::string& alias,
                        const std::string& mac,
                        int relayState,
                        const std::string& feature = "TIM") {
    return json{
        {"alias", alias},
        {"mac", mac},
        {"model", "HS110(US)"},
        {"type", "IOT.SMARTPLUGSWITCH"},
        {"relay_state", relayState},
        {"rssi", -52},
        {"sw_ver", "1.5.6 Build 191125 Rel.083657"},
        {"feature", feature},
        {"err_code", 0},
    };
}

inline protocol::Bytes legacyPayload(const json& sysinfo) {
    const json wrapped = {{"system", {{"get_sysinfo", sysinfo}}}};
    return protocol::xorEncode(wrapped.dump());
}

inline discovery::DiscoveryReply legacyReply(const std::string& address, const json& sysinfo) {
    return discovery::DiscoveryReply{address, 9999, protocol::ReplyEncoding::Legacy, sysinfo};
}

struct ChannelLog {
    std::mutex mutex;
    std::vector<json> requests;
    std::atomic_int closeCount{0};
};

class FakeChannel : public device::DeviceChannel {
public:
    using Handler = std::function<json(const json&)>;

    FakeChannel(std::shared_ptr<ChannelLog> log, Handler handler)
        : log_(std::move(log)), handler_(std::move(handler)) {}

    json query(const json& request) override {
        {
            std::lock_guard lock(log_->mutex);
            log_->requests.push_back(request);
        }
        return handler_(request);
    }

    void close() override {
        ++log_->closeCount;
    }

private:
    std::shared_ptr<ChannelLog> log_;
    Handler handler_;
};

// Minimal legacy plug: answers sysinfo, relay and emeter commands.
struct FakePlug {
    json sysinfo;
    json realtime;
    bool reachable{true};
    int commandErrCode{0};

    json handle(const json& request) {
        if (!reachable) {
            throw device::ChannelError("connect refused");
        }
        if (auto system = request.find("system"); system != request.end()) {
            if (system->contains("get_sysinfo")) {
                return {{"system", {{"get_sysinfo", sysinfo}}}};
            }
            if (system->contains("set_relay_state")) {
                if (commandErrCode == 0) {
                    sysinfo["relay_state"] = system->at("set_relay_state").at("state");
                }
                return {{"system", {{"set_relay_state", {{"err_code", commandErrCode}}}}}};
            }
        }
        if (request.contains("emeter") && !realtime.is_null()) {
            return {{"emeter", {{"get_realtime", realtime}}}};
        }
        return {{"err_code", -1}};
    }
};

class FakeTransport : public discovery::DiscoveryTransport {
public:
    std::vector<discovery::DiscoveryReply> replies;
    std::vector<std::optional<std::string>> calls;

    std::vector<discovery::DiscoveryReply> discover(std::chrono::milliseconds,
                                                    const std::optional<std::string>& targetIp) override {
        calls.push_back(targetIp);
        if (!targetIp) {
            return replies;
        }
        std::vector<discovery::DiscoveryReply> out;
        for (const auto& reply : replies) {
            if (reply.address == *targetIp) {
                out.push_back(reply);
            }
        }
        return out;
    }
};

// A set of fake plugs reachable through one FakeTransport.
struct FakeFleet {
    FakeTransport transport;
    std::map<std::string, std::shared_ptr<FakePlug>> plugs;
    std::map<std::string, std::shared_ptr<ChannelLog>> logs;

    std::shared_ptr<FakePlug> add(const std::string& address, const std::string& alias, const std::string& mac, int relay = 0) {
        auto plug = std::make_shared<FakePlug>();
        plug->sysinfo = plugSysinfo(alias, mac, relay);
        plugs[address] = plug;
        logs[address] = std::make_shared<ChannelLog>();
        transport.replies.push_back(legacyReply(address, plug->sysinfo));
        return plug;
    }

    device::ChannelFactory factory() {
        return [this](const discovery::DiscoveryReply& reply) -> std::unique_ptr<device::DeviceChannel> {
            auto plug = plugs.at(reply.address);
            return std::make_unique<FakeChannel>(logs.at(reply.address), [plug](const json& request) {
                return plug->handle(request);
            });
        };
    }

    int closes(const std::string& address) const {
        return logs.at(address)->closeCount.load();
    }
};

inline std::filesystem::path uniqueTempDir(const std::string& prefix) {
    static std::atomic_size_t counter{0};
    const auto suffix = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count() + counter++);
    auto path = std::filesystem::temp_directory_path() / (prefix + "-" + suffix);
    std::filesystem::create_directories(path);
    return path;
}

}  // namespace kasa::test
