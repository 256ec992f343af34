#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/vm/VirtualMachinePool.hpp"
#include "support/FakeBackend.hpp"
#include "support/TestLogging.hpp"

using namespace std::chrono_literals;
using Outcome = VirtualMachinePool::ReleaseOutcome;

namespace {

PoolConfig fastConfig(std::size_t minSize, std::size_t maxSize) {
    PoolConfig config;
    config.minSize = minSize;
    config.maxSize = maxSize;
    config.maintenanceInterval = 1h;
    config.bootTimeout = 2s;
    config.resetTimeout = 1s;
    config.stopTimeout = 500ms;
    config.initialPollInterval = 1ms;
    config.maxPollInterval = 5ms;
    config.machine.namePrefix = "test-vm";
    return config;
}

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

class PoolFixture : public ::testing::Test {
protected:
    std::unique_ptr<VirtualMachinePool> makePool(const PoolConfig& config) {
        return std::make_unique<VirtualMachinePool>(config, backend, snapshots);
    }

    std::shared_ptr<fakes::FakeControls> controls = std::make_shared<fakes::FakeControls>();
    std::shared_ptr<fakes::FakeBackend> backend = std::make_shared<fakes::FakeBackend>(controls);
    std::shared_ptr<fakes::FakeSnapshotService> snapshots = std::make_shared<fakes::FakeSnapshotService>(controls);
};

} // namespace

// Creations run concurrently: five 200ms boots finish in about one boot time.
TEST_F(PoolFixture, InitializeBootsMachinesInParallel) {
    controls->bootDelayMs = 200;
    auto pool = makePool(fastConfig(5, 10));

    const auto started = std::chrono::steady_clock::now();
    const std::size_t ready = pool->initialize();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(ready, 5u);
    EXPECT_EQ(pool->availableCount(), 5u);
    EXPECT_EQ(pool->state(), VirtualMachinePool::State::Ready);
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 600ms) << "serial creation would take about 1000ms";
    EXPECT_EQ(controls->created.load(), 5);
}

TEST_F(PoolFixture, InitializeIsIdempotentOnceReady) {
    auto pool = makePool(fastConfig(2, 4));
    EXPECT_EQ(pool->initialize(), 2u);
    EXPECT_EQ(pool->initialize(), 2u);
    EXPECT_EQ(controls->created.load(), 2);
}

// Failed creations are counted and cleaned up; the pool still becomes Ready.
TEST_F(PoolFixture, InitializeToleratesCreationFailures) {
    controls->failStart = true;
    auto pool = makePool(fastConfig(3, 5));

    EXPECT_EQ(pool->initialize(), 0u);
    EXPECT_EQ(pool->state(), VirtualMachinePool::State::Ready);

    const PoolStats stats = pool->stats();
    EXPECT_EQ(stats.creationFailures, 3u);
    EXPECT_EQ(stats.available, 0u);
    EXPECT_EQ(controls->live.load(), 0) << "failed machines are destroyed";
}

TEST_F(PoolFixture, ConstructorValidatesConfig) {
    PoolConfig config = fastConfig(6, 5);
    EXPECT_THROW(makePool(config), PoolConfigError);
    EXPECT_THROW(VirtualMachinePool(fastConfig(1, 2), nullptr, snapshots), PoolConfigError);
}

TEST_F(PoolFixture, AcquireRequiresReadyPool) {
    auto pool = makePool(fastConfig(1, 2));
    EXPECT_THROW((void)pool->acquire(10ms), PoolStateError);

    pool->initialize();
    pool->shutdown();
    EXPECT_THROW((void)pool->acquire(10ms), PoolStateError);
}

// min 3 / max 5: three acquires drain the pool, a fourth fails after its timeout,
// and a release makes the next acquire succeed at once.
TEST_F(PoolFixture, ExhaustionAndRecovery) {
    auto pool = makePool(fastConfig(3, 5));
    ASSERT_EQ(pool->initialize(), 3u);

    std::vector<std::unique_ptr<PooledMachine>> held;
    for (int i = 0; i < 3; ++i) {
        held.push_back(pool->acquire(1s));
    }
    EXPECT_EQ(pool->availableCount(), 0u);
    EXPECT_EQ(pool->checkedOutCount(), 3u);

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW((void)pool->acquire(100ms), PoolExhaustedError);
    const auto waited = std::chrono::steady_clock::now() - started;
    EXPECT_GE(waited, 100ms);
    EXPECT_LT(waited, 500ms);

    EXPECT_EQ(pool->release(std::move(held.back())), Outcome::Returned);
    held.pop_back();

    const auto again = std::chrono::steady_clock::now();
    auto machine = pool->acquire(10ms);
    EXPECT_NE(machine, nullptr);
    EXPECT_LT(std::chrono::steady_clock::now() - again, 100ms);
}

// A machine whose restore fails is destroyed and never comes back.
TEST_F(PoolFixture, ResetFailureDestroysMachine) {
    auto pool = makePool(fastConfig(2, 4));
    ASSERT_EQ(pool->initialize(), 2u);

    auto machine = pool->acquire(1s);
    const std::string failedName = machine->name();
    snapshots->failRestoreFor(failedName);
    const std::size_t availableBefore = pool->availableCount();

    EXPECT_EQ(pool->release(std::move(machine)), Outcome::DestroyedResetFailed);
    EXPECT_EQ(pool->availableCount(), availableBefore);
    EXPECT_EQ(pool->stats().resetFailures, 1u);
    EXPECT_EQ(controls->destroyed.load(), 1);

    auto next = pool->acquire(1s);
    EXPECT_NE(next->name(), failedName);
}

TEST_F(PoolFixture, MissingGoldenSnapshotIsResetFailure) {
    auto pool = makePool(fastConfig(1, 2));
    ASSERT_EQ(pool->initialize(), 1u);

    auto machine = pool->acquire(1s);
    controls->hideSnapshots = true;
    EXPECT_EQ(pool->release(std::move(machine)), Outcome::DestroyedResetFailed);
    EXPECT_EQ(controls->restores.load(), 0);
}

TEST_F(PoolFixture, ReleaseRestoresGoldenSnapshot) {
    auto pool = makePool(fastConfig(1, 2));
    ASSERT_EQ(pool->initialize(), 1u);

    auto machine = pool->acquire(1s);
    const std::string name = machine->name();
    EXPECT_EQ(machine->goldenSnapshotId, name + "-golden");

    EXPECT_EQ(pool->release(std::move(machine)), Outcome::Returned);
    EXPECT_EQ(controls->restores.load(), 1);
    EXPECT_EQ(pool->acquire(1s)->name(), name);
}

TEST_F(PoolFixture, ReleaseMisuseRejected) {
    auto pool = makePool(fastConfig(1, 2));
    ASSERT_EQ(pool->initialize(), 1u);

    EXPECT_THROW(pool->release(nullptr), PoolMisuseError);

    auto foreign = std::make_unique<PooledMachine>();
    foreign->id = 9999;
    foreign->machine = std::make_unique<fakes::FakeMachine>("foreign", controls);
    EXPECT_THROW(pool->release(std::move(foreign)), PoolMisuseError);

}

// Both pools number their machines from 1, so the ids collide; ownership is
// decided by the machine itself.
TEST_F(PoolFixture, ReleaseOfOtherPoolsMachineWithSameIdRejected) {
    auto pool = makePool(fastConfig(1, 2));
    auto otherPool = makePool(fastConfig(1, 2));
    ASSERT_EQ(pool->initialize(), 1u);
    ASSERT_EQ(otherPool->initialize(), 1u);

    auto mine = pool->acquire(1s);
    auto theirs = otherPool->acquire(1s);
    ASSERT_EQ(mine->id, theirs->id);

    EXPECT_THROW(pool->release(std::move(theirs)), PoolMisuseError);
    EXPECT_EQ(pool->availableCount(), 0u);
    EXPECT_EQ(pool->checkedOutCount(), 1u);

    EXPECT_EQ(pool->release(std::move(mine)), Outcome::Returned);
    EXPECT_EQ(pool->availableCount(), 1u);
    EXPECT_EQ(pool->checkedOutCount(), 0u);
}

// On-demand machines live outside the size accounting; returning one to a full
// pool destroys it.
TEST_F(PoolFixture, OnDemandCreationAndPoolFull) {
    PoolConfig config = fastConfig(1, 1);
    config.createOnDemand = true;
    auto pool = makePool(config);
    ASSERT_EQ(pool->initialize(), 1u);

    auto first = pool->acquire(1s);
    auto second = pool->acquire(50ms);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first->name(), second->name());
    EXPECT_EQ(pool->checkedOutCount(), 2u);

    EXPECT_EQ(pool->release(std::move(first)), Outcome::Returned);
    EXPECT_EQ(pool->release(std::move(second)), Outcome::DestroyedPoolFull);
    EXPECT_EQ(pool->availableCount(), 1u);
}

TEST_F(PoolFixture, OnDemandFailureIsExhaustion) {
    PoolConfig config = fastConfig(1, 1);
    config.createOnDemand = true;
    auto pool = makePool(config);
    ASSERT_EQ(pool->initialize(), 1u);

    auto held = pool->acquire(1s);
    controls->failCreate = true;
    EXPECT_THROW((void)pool->acquire(20ms), PoolExhaustedError);
}

// Concurrent acquire/release never hands one machine to two holders.
TEST_F(PoolFixture, NoDoubleCheckout) {
    auto pool = makePool(fastConfig(4, 4));
    ASSERT_EQ(pool->initialize(), 4u);

    std::mutex heldMutex;
    std::set<std::string> held;
    std::atomic<int> violations{0};
    std::atomic<int> served{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                std::unique_ptr<PooledMachine> machine;
                try {
                    machine = pool->acquire(2s);
                } catch (const PoolExhaustedError&) {
                    continue;
                }
                const std::string name = machine->name();
                {
                    std::lock_guard lock(heldMutex);
                    if (!held.insert(name).second) violations++;
                }
                std::this_thread::sleep_for(1ms);
                {
                    std::lock_guard lock(heldMutex);
                    held.erase(name);
                }
                served++;
                (void)pool->release(std::move(machine));
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_GT(served.load(), 0);
    EXPECT_EQ(pool->checkedOutCount(), 0u);
    EXPECT_LE(pool->availableCount(), 4u);
}

// After a maintenance cycle no machine older than the TTL is handed out.
TEST_F(PoolFixture, MaintenanceEvictsExpiredMachines) {
    PoolConfig config = fastConfig(2, 4);
    config.ttl = 1s;
    auto pool = makePool(config);
    ASSERT_EQ(pool->initialize(), 2u);

    std::set<std::string> originals;
    {
        auto a = pool->acquire(1s);
        auto b = pool->acquire(1s);
        originals = {a->name(), b->name()};
        pool->release(std::move(a));
        pool->release(std::move(b));
    }

    std::this_thread::sleep_for(1100ms);
    const MaintenanceReport report = pool->runMaintenanceCycle();
    EXPECT_EQ(report.evicted, 2u);
    EXPECT_EQ(report.scheduled, 2u);
    EXPECT_EQ(pool->stats().evictions, 2u);

    auto fresh = pool->acquire(2s);
    EXPECT_EQ(originals.count(fresh->name()), 0u);
}

// Expired machines found by acquire itself are skipped and replaced.
TEST_F(PoolFixture, AcquireSkipsExpiredMachines) {
    PoolConfig config = fastConfig(1, 2);
    config.ttl = 1s;
    auto pool = makePool(config);
    ASSERT_EQ(pool->initialize(), 1u);

    std::string original;
    {
        auto m = pool->acquire(1s);
        original = m->name();
        pool->release(std::move(m));
    }

    std::this_thread::sleep_for(1100ms);
    auto fresh = pool->acquire(2s);
    EXPECT_NE(fresh->name(), original);
    EXPECT_TRUE(waitUntil([&] { return controls->destroyed.load() == 1; }, 2s));
}

TEST_F(PoolFixture, MaintenanceRefillsToMinimum) {
    auto pool = makePool(fastConfig(3, 5));
    ASSERT_EQ(pool->initialize(), 3u);

    std::vector<std::unique_ptr<PooledMachine>> held;
    for (int i = 0; i < 3; ++i) held.push_back(pool->acquire(1s));

    const MaintenanceReport report = pool->runMaintenanceCycle();
    EXPECT_EQ(report.evicted, 0u);
    EXPECT_EQ(report.scheduled, 3u);
    EXPECT_TRUE(waitUntil([&] { return pool->availableCount() == 3; }, 2s));

    // Already at minimum: nothing more is scheduled.
    EXPECT_EQ(pool->runMaintenanceCycle().scheduled, 0u);
}

TEST_F(PoolFixture, MaintenanceTimerRefillsInBackground) {
    PoolConfig config = fastConfig(2, 4);
    config.maintenanceInterval = 20ms;
    auto pool = makePool(config);
    ASSERT_EQ(pool->initialize(), 2u);

    auto a = pool->acquire(1s);
    auto b = pool->acquire(1s);
    EXPECT_TRUE(waitUntil([&] { return pool->availableCount() == 2; }, 2s));
}

// A creation that completes after its acquirer gave up still lands in the pool.
TEST_F(PoolFixture, LateCreationIsStillEnqueued) {
    auto pool = makePool(fastConfig(1, 2));
    ASSERT_EQ(pool->initialize(), 1u);
    auto held = pool->acquire(1s);

    controls->bootDelayMs = 300;
    EXPECT_EQ(pool->runMaintenanceCycle().scheduled, 1u);
    EXPECT_THROW((void)pool->acquire(50ms), PoolExhaustedError);

    EXPECT_TRUE(waitUntil([&] { return pool->availableCount() == 1; }, 2s));
    EXPECT_EQ(pool->stats().pending, 0u);
}

TEST_F(PoolFixture, ShutdownDestroysEverything) {
    auto pool = makePool(fastConfig(2, 4));
    ASSERT_EQ(pool->initialize(), 2u);
    auto held = pool->acquire(1s);

    pool->shutdown();
    EXPECT_EQ(pool->state(), VirtualMachinePool::State::Shutdown);
    EXPECT_EQ(controls->destroyed.load(), 1);

    EXPECT_EQ(pool->release(std::move(held)), Outcome::DestroyedPoolClosed);
    EXPECT_EQ(controls->live.load(), 0);

    pool->shutdown();
    EXPECT_EQ(pool->state(), VirtualMachinePool::State::Shutdown);
}

TEST_F(PoolFixture, ShutdownWaitsForInFlightCreations) {
    auto pool = makePool(fastConfig(1, 3));
    ASSERT_EQ(pool->initialize(), 1u);
    auto held = pool->acquire(1s);

    controls->bootDelayMs = 200;
    EXPECT_EQ(pool->runMaintenanceCycle().scheduled, 1u);
    pool->shutdown();

    EXPECT_EQ(pool->stats().pending, 0u);
    EXPECT_EQ(pool->availableCount(), 0u);
    EXPECT_EQ(controls->live.load(), 1) << "only the checked-out machine is left";
}

TEST_F(PoolFixture, StatsTrackAcquisitions) {
    auto pool = makePool(fastConfig(2, 4));
    ASSERT_EQ(pool->initialize(), 2u);

    auto a = pool->acquire(1s);
    auto b = pool->acquire(1s);

    const PoolStats stats = pool->stats();
    EXPECT_EQ(stats.acquisitions, 2u);
    EXPECT_EQ(stats.checkedOut, 2u);
    EXPECT_EQ(stats.available, 0u);
    EXPECT_GT(stats.totalAcquireTime.count(), 0);
    EXPECT_EQ(stats.averageAcquireTime(), stats.totalAcquireTime / 2);
}
