#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * @brief Byte-stream duplex connection to one guest.
 *
 * write() and readSome() may be called from different threads at the same
 * time; two concurrent writers (or readers) are not supported.
 */
class ITransport {
public:
    virtual ~ITransport() noexcept = default;

    // Writes every byte or throws TransportError.
    virtual void write(std::span<const std::uint8_t> data) = 0;

    /**
     * Reads up to buffer.size() bytes, waiting at most until the deadline.
     *
     * @return number of bytes read; 0 means the deadline passed with no data
     * @throws TransportError when the peer closed the stream or the read failed
     */
    virtual std::size_t readSome(std::span<std::uint8_t> buffer,
                                 std::chrono::steady_clock::time_point deadline) = 0;

    virtual void close() noexcept = 0;
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;
};
