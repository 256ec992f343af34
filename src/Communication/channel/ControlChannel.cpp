#include "Communication/channel/ControlChannel.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include <stdexcept>
#include <string>

namespace PROTOCOL {

ControlChannel::ControlChannel(std::unique_ptr<ITransport> transport, ChannelOptions options)
    : transport_(std::move(transport)), options_(options) {
    if (!transport_) {
        throw std::invalid_argument("ControlChannel requires a transport");
    }
    if (options_.maxPayload == 0 || options_.maxPayload > kMaxPayloadSize) {
        throw std::invalid_argument("maxPayload must be between 1 and " + std::to_string(kMaxPayloadSize));
    }
}

ControlChannel::~ControlChannel() {
    close();
}

void ControlChannel::sendMessage(MessageType type, std::span<const std::uint8_t> payload) {
    // Oversized payloads are refused before any byte reaches the wire.
    const auto frame = encodeFrame(type, payload, options_.maxPayload);

    std::lock_guard lock(sendMutex_);
    ensureUsable();
    try {
        transport_->write(frame);
    } catch (const TransportError& e) {
        markBroken(e.what());
        throw;
    }
    AH_LOG_TRACE("Channel sent {} frame ({} bytes)", toString(type), payload.size());
}

void ControlChannel::sendMessage(MessageType type, std::string_view payload) {
    sendMessage(type, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(payload.data()),
                                                    payload.size()));
}

void ControlChannel::sendMessage(const Message& message) {
    sendMessage(message.type, std::span<const std::uint8_t>(message.payload));
}

Message ControlChannel::receiveMessage(std::chrono::milliseconds timeout) {
    std::lock_guard lock(receiveMutex_);
    ensureUsable();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try {
        if (!header_) {
            if (!fill(headerBytes_, headerFilled_, deadline)) {
                throw TimeoutError("no frame header within " + std::to_string(timeout.count()) + "ms");
            }
            const FrameHeader header = decodeHeader(headerBytes_);
            if (header.length > options_.maxPayload) {
                const std::string reason = "declared payload length " + std::to_string(header.length) +
                                           " exceeds limit of " + std::to_string(options_.maxPayload);
                markBroken(reason);
                throw ProtocolError(reason);
            }
            header_ = header;
            payload_.assign(header.length, 0);
            payloadFilled_ = 0;
        }

        if (!fill(payload_, payloadFilled_, deadline)) {
            throw TimeoutError("frame payload incomplete after " + std::to_string(timeout.count()) + "ms (" +
                               std::to_string(payloadFilled_) + "/" + std::to_string(payload_.size()) + " bytes)");
        }
    } catch (const TransportError& e) {
        markBroken(e.what());
        throw;
    }

    const FrameHeader header = *header_;
    std::vector<std::uint8_t> payload = std::move(payload_);
    resetPartialFrame();

    try {
        Message message = verifyFrame(header, std::move(payload));
        AH_LOG_TRACE("Channel received {} frame ({} bytes)", toString(message.type), message.payload.size());
        return message;
    } catch (const ProtocolError& e) {
        AH_LOG_WARN("Dropping invalid frame: {}", e.what());
        throw;
    }
}

bool ControlChannel::fill(std::span<std::uint8_t> buffer, std::size_t& filled,
                          std::chrono::steady_clock::time_point deadline) {
    while (filled < buffer.size()) {
        const std::size_t n = transport_->readSome(buffer.subspan(filled), deadline);
        if (n == 0) {
            return false;
        }
        filled += n;
    }
    return true;
}

void ControlChannel::close() noexcept {
    if (closed_.exchange(true)) return;
    transport_->close();
    AH_LOG_NOTHROW(debug, "Control channel closed");
}

bool ControlChannel::isOpen() const noexcept {
    return !closed_.load() && !broken_.load() && transport_->isOpen();
}

void ControlChannel::ensureUsable() const {
    if (closed_.load()) {
        throw TransportError("channel is closed");
    }
    if (broken_.load()) {
        throw TransportError("channel is broken");
    }
    if (!transport_->isOpen()) {
        throw TransportError("transport is not open");
    }
}

void ControlChannel::markBroken(std::string_view reason) noexcept {
    if (broken_.exchange(true)) return;
    AH_LOG_NOTHROW(error, "Control channel broken: {}", reason);
    transport_->close();
}

void ControlChannel::resetPartialFrame() noexcept {
    headerFilled_ = 0;
    header_.reset();
    payload_.clear();
    payloadFilled_ = 0;
}

} // namespace PROTOCOL
