#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kasa::protocol {

using Bytes = std::vector<std::uint8_t>;

constexpr std::uint8_t kLegacyXorKey = 0xAB;
constexpr std::size_t kStructuredHeaderSize = 16;
constexpr std::size_t kFrameHeaderSize = 4;

enum class ReplyEncoding {
    Legacy,
    Structured,
};

struct DecodedReply {
    ReplyEncoding encoding{ReplyEncoding::Legacy};
    // Legacy: the system.get_sysinfo object. Structured: the result object.
    nlohmann::json info;
};

Bytes xorEncode(const std::string& plaintext);
std::string xorDecode(const Bytes& ciphertext);

Bytes legacyDiscoveryRequest();
Bytes structuredDiscoveryRequest();

/**
 * @brief Decode one discovery datagram.
 *
 * Tries the legacy XOR encoding first and requires a system.get_sysinfo object;
 * falls back to plain JSON carrying a result object, with or without the 16-byte
 * binary header the structured protocol prepends. Returns std::nullopt when
 * neither scheme matches.
 */
std::optional<DecodedReply> decodeDiscoveryReply(const Bytes& payload);

// TCP command framing: 4-byte big-endian length followed by the XORed body.
Bytes frameCommand(const nlohmann::json& command);
std::uint32_t frameLength(const std::array<std::uint8_t, kFrameHeaderSize>& header);
nlohmann::json decodeFrameBody(const Bytes& body);

}  // namespace kasa::protocol
