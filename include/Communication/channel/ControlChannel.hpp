#pragma once

#include "Communication/channel/FrameCodec.hpp"
#include "Core/interfaces/ITransport.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace PROTOCOL {

struct ChannelOptions {
    // Frames declaring a larger payload are refused in both directions.
    std::size_t maxPayload = kMaxPayloadSize;
};

/**
 * @brief Framed message channel over one transport.
 *
 * One sender and one receiver may use the channel concurrently. A frame that
 * arrives only partly before a receive deadline is kept and completed by the
 * next receiveMessage() call.
 *
 * A frame with a bad checksum or unknown type is dropped with a ProtocolError
 * and the channel stays usable. A declared length above maxPayload means the
 * stream can no longer be trusted: the channel is marked broken and every
 * later call throws TransportError.
 */
class ControlChannel {
public:
    explicit ControlChannel(std::unique_ptr<ITransport> transport, ChannelOptions options = {});
    ~ControlChannel();

    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    void sendMessage(MessageType type, std::span<const std::uint8_t> payload);
    void sendMessage(MessageType type, std::string_view payload);
    void sendMessage(const Message& message);

    /**
     * @throws TimeoutError when no complete frame arrived in time
     * @throws ProtocolError when the frame failed validation
     * @throws TransportError when the channel is closed, broken or the peer hung up
     */
    [[nodiscard]] Message receiveMessage(std::chrono::milliseconds timeout);

    void close() noexcept;
    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] bool isBroken() const noexcept { return broken_.load(); }
    [[nodiscard]] const ChannelOptions& options() const noexcept { return options_; }

private:
    void ensureUsable() const;
    void markBroken(std::string_view reason) noexcept;
    void resetPartialFrame() noexcept;

    // Fills buffer[filled..] until full; false when the deadline passed first.
    bool fill(std::span<std::uint8_t> buffer, std::size_t& filled,
              std::chrono::steady_clock::time_point deadline);

    std::unique_ptr<ITransport> transport_;
    ChannelOptions options_;
    std::atomic<bool> broken_{false};
    std::atomic<bool> closed_{false};

    std::mutex sendMutex_;
    std::mutex receiveMutex_;

    // Partially received frame, guarded by receiveMutex_.
    std::array<std::uint8_t, kHeaderSize> headerBytes_{};
    std::size_t headerFilled_{0};
    std::optional<FrameHeader> header_;
    std::vector<std::uint8_t> payload_;
    std::size_t payloadFilled_{0};
};

} // namespace PROTOCOL
