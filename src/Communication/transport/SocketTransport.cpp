#include "Communication/transport/SocketTransport.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <linux/vm_sockets.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <optional>

SocketTransport::SocketTransport() : socket_(io_) {}

SocketTransport::~SocketTransport() {
    close();
    boost::system::error_code ignored;
    socket_.close(ignored);
}

std::unique_ptr<SocketTransport> SocketTransport::connectVsock(std::uint32_t cid, std::uint32_t port,
                                                               std::chrono::milliseconds timeout) {
    sockaddr_vm addr{};
    addr.svm_family = AF_VSOCK;
    addr.svm_cid = cid;
    addr.svm_port = port;

    std::unique_ptr<SocketTransport> transport(new SocketTransport());
    transport->connect(protocol_type::endpoint(&addr, sizeof(addr)), timeout);
    AH_LOG_DEBUG("Connected to vsock {}:{}", cid, port);
    return transport;
}

std::unique_ptr<SocketTransport> SocketTransport::connectUnix(const std::string& path,
                                                              std::chrono::milliseconds timeout) {
    std::unique_ptr<SocketTransport> transport(new SocketTransport());
    transport->connect(protocol_type::endpoint(boost::asio::local::stream_protocol::endpoint(path)), timeout);
    AH_LOG_DEBUG("Connected to unix socket {}", path);
    return transport;
}

std::unique_ptr<SocketTransport> SocketTransport::adopt(int fd, int family) {
    std::unique_ptr<SocketTransport> transport(new SocketTransport());
    boost::system::error_code ec;
    transport->socket_.assign(protocol_type(family, 0), fd, ec);
    if (ec) {
        ::close(fd);
        throw TransportError("cannot adopt socket: " + ec.message());
    }
    transport->open_ = true;
    return transport;
}

std::pair<std::unique_ptr<SocketTransport>, std::unique_ptr<SocketTransport>> SocketTransport::createPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw TransportError(std::string("socketpair failed: ") + std::strerror(errno));
    }
    std::unique_ptr<SocketTransport> first;
    try {
        first = adopt(fds[0], AF_UNIX);
    } catch (const TransportError&) {
        ::close(fds[1]);
        throw;
    }
    return {std::move(first), adopt(fds[1], AF_UNIX)};
}

void SocketTransport::connect(const protocol_type::endpoint& endpoint, std::chrono::milliseconds timeout) {
    std::optional<boost::system::error_code> result;
    socket_.async_connect(endpoint, [&result](const boost::system::error_code& ec) { result = ec; });

    io_.restart();
    io_.run_for(timeout);
    if (!result) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_.restart();
        io_.run();
        throw TransportError("connect timed out after " + std::to_string(timeout.count()) + "ms");
    }
    if (*result) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        throw TransportError("connect failed: " + result->message());
    }
    open_ = true;
}

void SocketTransport::write(std::span<const std::uint8_t> data) {
    if (!open_) {
        throw TransportError("write on closed socket");
    }
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(data.data(), data.size()), ec);
    if (ec) {
        open_ = false;
        throw TransportError("write failed: " + ec.message());
    }
}

std::size_t SocketTransport::readSome(std::span<std::uint8_t> buffer,
                                      std::chrono::steady_clock::time_point deadline) {
    if (!open_) {
        throw TransportError(closedLocally_ ? "transport closed locally" : "read on closed socket");
    }
    if (buffer.empty()) {
        return 0;
    }

    std::optional<boost::system::error_code> result;
    std::size_t transferred = 0;
    socket_.async_read_some(boost::asio::buffer(buffer.data(), buffer.size()),
                            [&](const boost::system::error_code& ec, std::size_t n) {
                                result = ec;
                                transferred = n;
                            });

    io_.restart();
    io_.run_until(deadline);
    if (!result) {
        // A read that completed right at the deadline is still collected here.
        io_.poll();
    }
    if (!result) {
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        io_.restart();
        io_.run();
    }

    if (!result || *result == boost::asio::error::operation_aborted) {
        return transferred;
    }
    if (*result) {
        open_ = false;
        if (closedLocally_) {
            throw TransportError("transport closed locally");
        }
        if (*result == boost::asio::error::eof) {
            throw TransportError("connection closed by peer");
        }
        throw TransportError("read failed: " + result->message());
    }
    return transferred;
}

void SocketTransport::close() noexcept {
    std::lock_guard lock(closeMutex_);
    open_ = false;
    if (closedLocally_.exchange(true)) return;
    const int fd = socket_.native_handle();
    if (fd < 0) return;
    // A reader may be inside io_.run_until() on another thread: only shut the
    // stream down here, which completes its pending read. The descriptor is
    // released by the destructor.
    if (::shutdown(fd, SHUT_RDWR) != 0 && errno != ENOTCONN) {
        AH_LOG_NOTHROW(warn, "Socket shutdown reported: {}", std::strerror(errno));
    }
}
