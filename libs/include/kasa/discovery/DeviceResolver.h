#pragma once

#include "kasa/device/DeviceSession.h"
#include "kasa/discovery/DeviceScanner.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kasa::discovery {

enum class ResolveStatus {
    Found,
    NotFound,
    Ambiguous,
};

struct Candidate {
    std::string name;
    std::string ip;
};

struct Resolution {
    ResolveStatus status{ResolveStatus::NotFound};
    std::unique_ptr<device::DeviceSession> session;
    std::vector<Candidate> candidates;
};

/**
 * @brief Turns a user-typed identifier into exactly one live device session.
 *
 * Identifiers are either an IPv4 literal or a fragment of the device name. A name
 * fragment is matched case-insensitively against every device that answered a
 * broadcast round; more than one hit is reported as ambiguous with the full
 * candidate list rather than picking one.
 */
class DeviceResolver {
public:
    explicit DeviceResolver(DeviceScanner& scanner);

    /**
     * @brief Resolve @p identifier within @p timeout.
     *
     * - IPv4 literal: the host is queried directly. No answer, or a refresh that
     *   fails, yields NotFound.
     * - Name fragment: zero matches yield NotFound, one yields Found with that
     *   session, several yield Ambiguous with every match listed in candidates.
     * - Every session that is not handed back is released before returning.
     */
    Resolution resolve(const std::string& identifier, std::chrono::milliseconds timeout) const;

    // Four dot-separated groups of digits.
    static bool isIpv4Literal(const std::string& identifier);

private:
    Resolution resolveAddress(const std::string& address, std::chrono::milliseconds timeout) const;
    Resolution resolveName(const std::string& fragment, std::chrono::milliseconds timeout) const;

    DeviceScanner& scanner_;
};

}  // namespace kasa::discovery
