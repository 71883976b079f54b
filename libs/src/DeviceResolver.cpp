#include "kasa/discovery/DeviceResolver.h"

#include "kasa/common/DeviceRecord.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <utility>

namespace kasa::discovery {

namespace {

void releaseAll(SessionList& sessions) {
    for (auto& session : sessions) {
        if (session) {
            session->release();
        }
    }
}

}  // namespace

DeviceResolver::DeviceResolver(DeviceScanner& scanner)
    : scanner_(scanner) {}

bool DeviceResolver::isIpv4Literal(const std::string& identifier) {
    std::size_t groups = 0;
    std::size_t digits = 0;
    for (char c : identifier) {
        if (c == '.') {
            if (digits == 0) {
                return false;
            }
            ++groups;
            digits = 0;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        ++digits;
    }
    return digits > 0 && groups == 3;
}

Resolution DeviceResolver::resolve(const std::string& identifier, std::chrono::milliseconds timeout) const {
    if (identifier.empty()) {
        return {};
    }
    if (isIpv4Literal(identifier)) {
        return resolveAddress(identifier, timeout);
    }
    return resolveName(identifier, timeout);
}

Resolution DeviceResolver::resolveAddress(const std::string& address, std::chrono::milliseconds timeout) const {
    SessionList sessions = scanner_.openSessions(timeout, address);
    Resolution resolution;
    if (sessions.empty()) {
        spdlog::debug("No reply from {}", address);
        return resolution;
    }

    auto& session = sessions.front();
    if (session->degraded()) {
        spdlog::debug("{} answered discovery but could not be refreshed", address);
        releaseAll(sessions);
        return resolution;
    }

    resolution.status = ResolveStatus::Found;
    resolution.session = std::move(session);
    releaseAll(sessions);
    return resolution;
}

Resolution DeviceResolver::resolveName(const std::string& fragment, std::chrono::milliseconds timeout) const {
    SessionList sessions = scanner_.openSessions(timeout);

    std::vector<std::size_t> matches;
    for (std::size_t i = 0; i < sessions.size(); ++i) {
        if (common::containsIgnoreCase(sessions[i]->name(), fragment)) {
            matches.push_back(i);
        }
    }

    Resolution resolution;
    if (matches.size() == 1) {
        resolution.status = ResolveStatus::Found;
        resolution.session = std::move(sessions[matches.front()]);
    } else if (matches.size() > 1) {
        resolution.status = ResolveStatus::Ambiguous;
        for (std::size_t index : matches) {
            resolution.candidates.push_back(Candidate{sessions[index]->name(), sessions[index]->address()});
        }
    }

    spdlog::debug("'{}' matched {} of {} device(s)", fragment, matches.size(), sessions.size());
    releaseAll(sessions);
    return resolution;
}

}  // namespace kasa::discovery
