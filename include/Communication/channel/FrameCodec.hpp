#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PROTOCOL {

enum class MessageType : std::uint8_t {
    Execute = 1,
    Result = 2,
    Status = 3,
    Error = 4,
    Stop = 5,
    Heartbeat = 6
};

[[nodiscard]] std::string_view toString(MessageType type) noexcept;
[[nodiscard]] bool isKnownMessageType(std::uint8_t raw) noexcept;

struct Message {
    MessageType type{MessageType::Heartbeat};
    std::vector<std::uint8_t> payload;

    [[nodiscard]] static Message fromText(MessageType type, std::string_view text);
    [[nodiscard]] std::string text() const;

    bool operator==(const Message&) const = default;
};

// Header layout, network byte order: type (1) | payload length (2) | CRC-32 of payload (4).
inline constexpr std::size_t kHeaderSize = 7;
inline constexpr std::size_t kMaxPayloadSize = 0xFFFF;

struct FrameHeader {
    std::uint8_t type{0};
    std::uint16_t length{0};
    std::uint32_t checksum{0};
};

[[nodiscard]] std::uint32_t computeChecksum(std::span<const std::uint8_t> payload) noexcept;

[[nodiscard]] std::array<std::uint8_t, kHeaderSize> encodeHeader(const FrameHeader& header) noexcept;
[[nodiscard]] FrameHeader decodeHeader(std::span<const std::uint8_t, kHeaderSize> bytes) noexcept;

/**
 * @brief Builds a complete frame (header + payload).
 * @throws ProtocolError when the payload exceeds maxPayload
 */
[[nodiscard]] std::vector<std::uint8_t> encodeFrame(MessageType type,
                                                    std::span<const std::uint8_t> payload,
                                                    std::size_t maxPayload = kMaxPayloadSize);

/**
 * @brief Checks a received payload against its header.
 * @throws ProtocolError on checksum mismatch, length mismatch or unknown type
 */
[[nodiscard]] Message verifyFrame(const FrameHeader& header, std::vector<std::uint8_t> payload);

// Decodes exactly one frame held in `frame`; truncated or trailing bytes are a ProtocolError.
[[nodiscard]] Message decodeFrame(std::span<const std::uint8_t> frame, std::size_t maxPayload = kMaxPayloadSize);

} // namespace PROTOCOL
