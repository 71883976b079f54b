#include "kasa/protocol/WireCodec.h"

#include <stdexcept>

namespace kasa::protocol {

namespace {

using json = nlohmann::json;

constexpr std::array<std::uint8_t, kStructuredHeaderSize> kStructuredRequest{
    0x02, 0x00, 0x00, 0x01, 0x01, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x46, 0x3b, 0xe8, 0x78,
};

std::optional<json> parseObject(Bytes::const_iterator first, Bytes::const_iterator last) {
    json parsed = json::parse(first, last, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<DecodedReply> decodeLegacy(const Bytes& payload) {
    const std::string plain = xorDecode(payload);
    json parsed = json::parse(plain, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    auto system = parsed.find("system");
    if (system == parsed.end() || !system->is_object()) {
        return std::nullopt;
    }
    auto sysinfo = system->find("get_sysinfo");
    if (sysinfo == system->end() || !sysinfo->is_object()) {
        return std::nullopt;
    }
    return DecodedReply{ReplyEncoding::Legacy, *sysinfo};
}

std::optional<DecodedReply> structuredFrom(const std::optional<json>& parsed) {
    if (!parsed) {
        return std::nullopt;
    }
    auto result = parsed->find("result");
    if (result == parsed->end() || !result->is_object()) {
        return std::nullopt;
    }
    return DecodedReply{ReplyEncoding::Structured, *result};
}

std::optional<DecodedReply> decodeStructured(const Bytes& payload) {
    if (auto reply = structuredFrom(parseObject(payload.begin(), payload.end()))) {
        return reply;
    }
    if (payload.size() > kStructuredHeaderSize && payload.front() == kStructuredRequest.front()) {
        return structuredFrom(parseObject(payload.begin() + kStructuredHeaderSize, payload.end()));
    }
    return std::nullopt;
}

}  // namespace

Bytes xorEncode(const std::string& plaintext) {
    Bytes out;
    out.reserve(plaintext.size());
    for (char c : plaintext) {
        out.push_back(static_cast<std::uint8_t>(static_cast<std::uint8_t>(c) ^ kLegacyXorKey));
    }
    return out;
}

std::string xorDecode(const Bytes& ciphertext) {
    std::string out;
    out.reserve(ciphertext.size());
    for (std::uint8_t b : ciphertext) {
        out.push_back(static_cast<char>(b ^ kLegacyXorKey));
    }
    return out;
}

Bytes legacyDiscoveryRequest() {
    static const json request = {{"system", {{"get_sysinfo", json::object()}}}};
    return xorEncode(request.dump());
}

Bytes structuredDiscoveryRequest() {
    return Bytes(kStructuredRequest.begin(), kStructuredRequest.end());
}

std::optional<DecodedReply> decodeDiscoveryReply(const Bytes& payload) {
    if (payload.empty()) {
        return std::nullopt;
    }
    if (auto legacy = decodeLegacy(payload)) {
        return legacy;
    }
    return decodeStructured(payload);
}

Bytes frameCommand(const json& command) {
    const Bytes body = xorEncode(command.dump());
    const auto length = static_cast<std::uint32_t>(body.size());

    Bytes frame;
    frame.reserve(kFrameHeaderSize + body.size());
    for (std::size_t i = 0; i < kFrameHeaderSize; ++i) {
        frame.push_back(static_cast<std::uint8_t>((length >> (24U - static_cast<unsigned>(i) * 8U)) & 0xFFU));
    }
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

std::uint32_t frameLength(const std::array<std::uint8_t, kFrameHeaderSize>& header) {
    std::uint32_t length = 0;
    for (std::uint8_t b : header) {
        length = (length << 8U) | b;
    }
    return length;
}

json decodeFrameBody(const Bytes& body) {
    json parsed = json::parse(xorDecode(body), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw std::runtime_error("Malformed command response");
    }
    return parsed;
}

}  // namespace kasa::protocol
