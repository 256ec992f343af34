#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "Core/concurrency/EventDispatcher.hpp"
#include "support/TestLogging.hpp"

using CONCURRENCY::EventDispatcher;
using namespace std::chrono_literals;

namespace {

// Counts down to zero; waitFor() reports whether it got there in time.
class Latch {
public:
    explicit Latch(int count) : count_(count) {}

    void countDown() {
        std::lock_guard lock(mutex_);
        if (--count_ <= 0) cv_.notify_all();
    }

    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return count_ <= 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int count_;
};

} // namespace

TEST(EventDispatcher, RunsDispatchedTasks) {
    EventDispatcher dispatcher(4);
    Latch done(100);
    std::atomic<int> ran{0};

    for (int i = 0; i < 100; ++i) {
        dispatcher.dispatch([&] {
            ran++;
            done.countDown();
        });
    }

    ASSERT_TRUE(done.waitFor(2s));
    EXPECT_EQ(ran.load(), 100);
    EXPECT_TRUE(dispatcher.running());
    EXPECT_EQ(dispatcher.threadCount(), 4u);
}

// Tasks run in parallel across the worker threads.
TEST(EventDispatcher, TasksRunConcurrently) {
    EventDispatcher dispatcher(4);
    Latch done(4);

    const auto started = std::chrono::steady_clock::now();
    for (int i = 0; i < 4; ++i) {
        dispatcher.dispatch([&] {
            std::this_thread::sleep_for(100ms);
            done.countDown();
        });
    }
    ASSERT_TRUE(done.waitFor(2s));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 300ms);
}

// A throwing task is logged and does not take the worker down.
TEST(EventDispatcher, ThrowingTaskDoesNotStopWorkers) {
    EventDispatcher dispatcher(1);
    Latch done(1);

    dispatcher.dispatch([] { throw std::runtime_error("task failure"); });
    dispatcher.dispatch([&] { done.countDown(); });

    EXPECT_TRUE(done.waitFor(2s));
}

TEST(EventDispatcher, DelayedTaskFiresAfterDelay) {
    EventDispatcher dispatcher(1);
    Latch done(1);

    const auto started = std::chrono::steady_clock::now();
    auto timer = dispatcher.dispatch_delayed(50ms, [&] { done.countDown(); });
    ASSERT_NE(timer, nullptr);

    ASSERT_TRUE(done.waitFor(2s));
    EXPECT_GE(std::chrono::steady_clock::now() - started, 50ms);
}

TEST(EventDispatcher, CancelledTimerNeverFires) {
    EventDispatcher dispatcher(1);
    std::atomic<bool> fired{false};

    auto timer = dispatcher.dispatch_delayed(50ms, [&] { fired = true; });
    timer->cancel();
    EXPECT_TRUE(timer->cancelled());

    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(fired.load());
}

TEST(EventDispatcher, StopAndRestart) {
    EventDispatcher dispatcher(2);
    dispatcher.stop();
    EXPECT_FALSE(dispatcher.running());

    dispatcher.start();
    Latch done(1);
    dispatcher.dispatch([&] { done.countDown(); });
    EXPECT_TRUE(done.waitFor(2s));
}
