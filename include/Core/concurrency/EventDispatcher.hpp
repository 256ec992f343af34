#pragma once
#include <utility> // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <functional>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace CONCURRENCY {
namespace asio = boost::asio;
using namespace std::chrono_literals;

class Timer {
public:
    Timer(asio::io_context& io, std::chrono::steady_clock::duration dur, std::function<void()> cb);
    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;
    ~Timer();

    // non-copyable, but shareable via shared_ptr<Timer>
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

/**
 * @brief Fixed-size thread pool over a Boost.Asio io_context.
 *
 * Tasks that throw a std::exception are logged and dropped; the worker
 * thread keeps running.
 */
class EventDispatcher {
public:
    explicit EventDispatcher(size_t threads = std::thread::hardware_concurrency());
    ~EventDispatcher();

    // Post immediate task
    void dispatch(std::function<void()> f);

    // Post delayed task (returns shared_ptr to Timer to allow cancel)
    std::shared_ptr<Timer> dispatch_delayed(std::chrono::steady_clock::duration dur, std::function<void()> f);

    // Control lifecycle
    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] size_t threadCount() const noexcept;

    // non-copyable
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace CONCURRENCY
