#include "Communication/channel/FrameCodec.hpp"
#include "Utils/Exception.hpp"
#include <boost/crc.hpp>
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <cstring>
#include <sstream>

namespace PROTOCOL {

std::string_view toString(MessageType type) noexcept {
    switch (type) {
        case MessageType::Execute:   return "execute";
        case MessageType::Result:    return "result";
        case MessageType::Status:    return "status";
        case MessageType::Error:     return "error";
        case MessageType::Stop:      return "stop";
        case MessageType::Heartbeat: return "heartbeat";
    }
    return "unknown";
}

bool isKnownMessageType(std::uint8_t raw) noexcept {
    return raw >= static_cast<std::uint8_t>(MessageType::Execute) &&
           raw <= static_cast<std::uint8_t>(MessageType::Heartbeat);
}

Message Message::fromText(MessageType type, std::string_view text) {
    Message m;
    m.type = type;
    m.payload.assign(text.begin(), text.end());
    return m;
}

std::string Message::text() const {
    return std::string(payload.begin(), payload.end());
}

std::uint32_t computeChecksum(std::span<const std::uint8_t> payload) noexcept {
    boost::crc_32_type crc;
    crc.process_bytes(payload.data(), payload.size());
    return crc.checksum();
}

std::array<std::uint8_t, kHeaderSize> encodeHeader(const FrameHeader& header) noexcept {
    std::array<std::uint8_t, kHeaderSize> out{};
    const std::uint16_t length = boost::endian::native_to_big(header.length);
    const std::uint32_t checksum = boost::endian::native_to_big(header.checksum);
    out[0] = header.type;
    std::memcpy(out.data() + 1, &length, sizeof(length));
    std::memcpy(out.data() + 3, &checksum, sizeof(checksum));
    return out;
}

FrameHeader decodeHeader(std::span<const std::uint8_t, kHeaderSize> bytes) noexcept {
    FrameHeader header;
    std::uint16_t length = 0;
    std::uint32_t checksum = 0;
    header.type = bytes[0];
    std::memcpy(&length, bytes.data() + 1, sizeof(length));
    std::memcpy(&checksum, bytes.data() + 3, sizeof(checksum));
    header.length = boost::endian::big_to_native(length);
    header.checksum = boost::endian::big_to_native(checksum);
    return header;
}

std::vector<std::uint8_t> encodeFrame(MessageType type,
                                      std::span<const std::uint8_t> payload,
                                      std::size_t maxPayload) {
    if (payload.size() > maxPayload || payload.size() > kMaxPayloadSize) {
        throw ProtocolError("payload of " + std::to_string(payload.size()) + " bytes exceeds limit of " +
                            std::to_string(std::min(maxPayload, kMaxPayloadSize)));
    }

    FrameHeader header;
    header.type = static_cast<std::uint8_t>(type);
    header.length = static_cast<std::uint16_t>(payload.size());
    header.checksum = computeChecksum(payload);

    const auto head = encodeHeader(header);
    std::vector<std::uint8_t> frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.insert(frame.end(), head.begin(), head.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

Message verifyFrame(const FrameHeader& header, std::vector<std::uint8_t> payload) {
    if (payload.size() != header.length) {
        throw ProtocolError("payload length " + std::to_string(payload.size()) + " does not match header length " +
                            std::to_string(header.length));
    }
    const std::uint32_t actual = computeChecksum(payload);
    if (actual != header.checksum) {
        std::ostringstream msg;
        msg << "checksum mismatch: expected 0x" << std::hex << header.checksum << ", got 0x" << actual;
        throw ProtocolError(msg.str());
    }
    if (!isKnownMessageType(header.type)) {
        throw ProtocolError("unknown message type " + std::to_string(header.type));
    }

    Message m;
    m.type = static_cast<MessageType>(header.type);
    m.payload = std::move(payload);
    return m;
}

Message decodeFrame(std::span<const std::uint8_t> frame, std::size_t maxPayload) {
    if (frame.size() < kHeaderSize) {
        throw ProtocolError("frame too short: " + std::to_string(frame.size()) + " bytes");
    }
    const FrameHeader header = decodeHeader(frame.first<kHeaderSize>());
    if (header.length > maxPayload) {
        throw ProtocolError("declared payload length " + std::to_string(header.length) + " exceeds limit of " +
                            std::to_string(maxPayload));
    }
    if (frame.size() != kHeaderSize + header.length) {
        throw ProtocolError("frame size " + std::to_string(frame.size()) + " does not match declared length " +
                            std::to_string(header.length));
    }
    const auto body = frame.subspan(kHeaderSize);
    return verifyFrame(header, std::vector<std::uint8_t>(body.begin(), body.end()));
}

} // namespace PROTOCOL
