#include "kasa/discovery/DeviceScanner.h"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace kasa::discovery {

DeviceScanner::DeviceScanner(DiscoveryTransport& transport,
                             device::ChannelFactory channelFactory,
                             std::size_t maxParallel)
    : transport_(transport),
      channelFactory_(std::move(channelFactory)),
      maxParallel_(std::max<std::size_t>(maxParallel, 1)) {}

SessionList DeviceScanner::openSessions(std::chrono::milliseconds timeout,
                                        const std::optional<std::string>& targetIp) {
    auto replies = transport_.discover(timeout, targetIp);

    SessionList sessions;
    sessions.reserve(replies.size());
    for (auto& reply : replies) {
        const std::string address = reply.address;
        try {
            std::unique_ptr<device::DeviceChannel> channel;
            if (channelFactory_) {
                channel = channelFactory_(reply);
            }
            sessions.push_back(std::make_unique<device::DeviceSession>(std::move(reply), std::move(channel)));
        } catch (const std::exception& ex) {
            spdlog::warn("Dropping reply from {}: {}", address, ex.what());
        }
    }

    refreshAll(sessions);
    return sessions;
}

std::vector<common::DeviceRecord> DeviceScanner::scan(std::chrono::milliseconds timeout,
                                                      const std::optional<std::string>& targetIp,
                                                      bool includeEnergy) {
    SessionList sessions = openSessions(timeout, targetIp);

    std::vector<common::DeviceRecord> records;
    records.reserve(sessions.size());
    for (auto& session : sessions) {
        records.push_back(session->record(includeEnergy));
        session->release();
    }

    common::sortRecords(records);
    spdlog::debug("Scan produced {} record(s)", records.size());
    return records;
}

void DeviceScanner::refreshAll(SessionList& sessions) const {
    if (sessions.empty()) {
        return;
    }

    asio::thread_pool pool(std::min(maxParallel_, sessions.size()));
    for (auto& session : sessions) {
        device::DeviceSession* target = session.get();
        asio::post(pool, [target] {
            try {
                const auto status = target->refresh();
                if (status == device::CallStatus::Unsupported) {
                    spdlog::debug("{} answered the structured discovery request only; using discovery data",
                                  target->address());
                } else if (status != device::CallStatus::Ok) {
                    spdlog::warn("{} is degraded ({})", target->address(), device::callStatusName(status));
                }
            } catch (const std::exception& ex) {
                spdlog::error("Refresh of {} aborted: {}", target->address(), ex.what());
            }
        });
    }
    pool.join();
}

}  // namespace kasa::discovery
