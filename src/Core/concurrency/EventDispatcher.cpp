#include "Core/concurrency/EventDispatcher.hpp"
#include "System/Logger.hpp"
#include <boost/system/error_code.hpp>
#include <atomic>
#include <exception>

namespace CONCURRENCY {

namespace {

void runGuarded(const std::function<void()>& f, const char* what) {
    try {
        f();
    } catch (const std::exception& e) {
        AH_LOG_NOTHROW(error, "{} failed: {}", what, e.what());
    }
}

} // namespace

//
// Timer::Impl
//
struct Timer::Impl : std::enable_shared_from_this<Impl> {
    asio::steady_timer timer;
    std::function<void()> cb;
    std::atomic<bool> cancelled{false};

    Impl(asio::io_context& io, std::chrono::steady_clock::duration dur, std::function<void()> cb_)
        : timer(io, dur), cb(std::move(cb_))
    {}

    // The pending handler keeps the Impl alive until it has run or been aborted.
    void arm() {
        timer.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec || self->cancelled.load()) return;
            if (self->cb) runGuarded(self->cb, "Delayed task");
        });
    }

    void cancel() noexcept {
        if (cancelled.exchange(true)) return;
        boost::system::error_code ec;
        timer.cancel(ec);
    }
};

Timer::Timer(asio::io_context& io, std::chrono::steady_clock::duration dur, std::function<void()> cb)
    : impl_(std::make_shared<Impl>(io, dur, std::move(cb)))
{
    impl_->arm();
}

void Timer::cancel() noexcept {
    if (impl_) impl_->cancel();
}

bool Timer::cancelled() const noexcept {
    return impl_ && impl_->cancelled.load();
}

Timer::~Timer() {
    cancel();
}

//
// EventDispatcher::Impl
//
struct EventDispatcher::Impl {
    asio::io_context io_ctx;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard;
    std::vector<std::thread> threads;
    size_t thread_count{1};
    std::atomic<bool> running{false};

    explicit Impl(size_t threads_count)
        : thread_count(threads_count)
    {}

    void run_threads() {
        if (running.exchange(true)) return;
        io_ctx.restart();
        work_guard = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_ctx));
        for (size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([this]() { io_ctx.run(); });
        }
    }

    void stop_threads() {
        if (!running.exchange(false)) return;
        work_guard.reset();
        io_ctx.stop();
        for (auto &t : threads) {
            if (t.joinable()) t.join();
        }
        threads.clear();
    }
};

EventDispatcher::EventDispatcher(size_t threads)
    : impl_(std::make_unique<Impl>(threads == 0 ? 1 : threads))
{
    impl_->run_threads();
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::dispatch(std::function<void()> f) {
    if (!f) return;
    asio::post(impl_->io_ctx, [f = std::move(f)]() { runGuarded(f, "Dispatched task"); });
}

std::shared_ptr<Timer> EventDispatcher::dispatch_delayed(std::chrono::steady_clock::duration dur, std::function<void()> f) {
    if (!f) return nullptr;
    return std::make_shared<Timer>(impl_->io_ctx, dur, std::move(f));
}

void EventDispatcher::start() {
    impl_->run_threads();
}

void EventDispatcher::stop() {
    impl_->stop_threads();
}

bool EventDispatcher::running() const noexcept {
    return impl_->running.load();
}

size_t EventDispatcher::threadCount() const noexcept {
    return impl_->thread_count;
}

} // namespace CONCURRENCY
