#pragma once

#include "Core/interfaces/ITransport.hpp"
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

/**
 * @brief Stream socket transport (AF_VSOCK or AF_UNIX) driven by a private io_context.
 *
 * Reads run asynchronously against the caller's deadline; writes are blocking.
 */
class SocketTransport : public ITransport {
public:
    using protocol_type = boost::asio::generic::stream_protocol;

    static constexpr std::uint32_t kDefaultVsockPort = 9000;

    // Connects to the guest agent listening on vsock `cid`:`port`.
    static std::unique_ptr<SocketTransport> connectVsock(std::uint32_t cid,
                                                         std::uint32_t port = kDefaultVsockPort,
                                                         std::chrono::milliseconds timeout = std::chrono::seconds(5));

    static std::unique_ptr<SocketTransport> connectUnix(const std::string& path,
                                                        std::chrono::milliseconds timeout = std::chrono::seconds(5));

    // Takes ownership of an already connected stream socket.
    static std::unique_ptr<SocketTransport> adopt(int fd, int family);

    // Two connected AF_UNIX endpoints.
    static std::pair<std::unique_ptr<SocketTransport>, std::unique_ptr<SocketTransport>> createPair();

    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void write(std::span<const std::uint8_t> data) override;
    std::size_t readSome(std::span<std::uint8_t> buffer,
                         std::chrono::steady_clock::time_point deadline) override;
    void close() noexcept override;
    [[nodiscard]] bool isOpen() const noexcept override { return open_.load(); }

private:
    SocketTransport();

    void connect(const protocol_type::endpoint& endpoint, std::chrono::milliseconds timeout);

    boost::asio::io_context io_;
    protocol_type::socket socket_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closedLocally_{false};
    std::mutex closeMutex_;
};
