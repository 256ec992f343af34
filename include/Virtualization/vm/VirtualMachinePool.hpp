#pragma once

#include "Core/concurrency/EventDispatcher.hpp"
#include "Core/interfaces/ISnapshotService.hpp"
#include "Core/interfaces/IVirtualizationBackend.hpp"
#include "Virtualization/vm/PooledMachine.hpp"
#include "Virtualization/vm/StateWaiter.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

struct PoolStats {
    std::size_t available{0};
    std::size_t checkedOut{0};
    std::size_t pending{0};
    std::uint64_t acquisitions{0};
    std::chrono::nanoseconds totalAcquireTime{0};
    std::uint64_t creationFailures{0};
    std::uint64_t resetFailures{0};
    std::uint64_t evictions{0};
    std::uint64_t destroyed{0};

    [[nodiscard]] std::chrono::nanoseconds averageAcquireTime() const noexcept {
        return acquisitions == 0 ? std::chrono::nanoseconds{0}
                                 : totalAcquireTime / static_cast<std::int64_t>(acquisitions);
    }
};

struct MaintenanceReport {
    std::size_t evicted{0};
    std::size_t scheduled{0};
};

/**
 * @brief Pool of pre-booted machines that are recycled through a golden snapshot.
 *
 * The available set, the checked-out ids and the count of in-flight creations
 * are guarded by one mutex. Creations, deferred destroys and the periodic
 * maintenance cycle run on the pool's own EventDispatcher.
 *
 * Size accounting: available + in-flight creations never exceeds maxSize.
 * Machines handed out by acquire() are outside that count.
 */
class VirtualMachinePool {
public:
    enum class State { Uninitialized, Initializing, Ready, Draining, Shutdown };
    enum class ReleaseOutcome { Returned, DestroyedPoolFull, DestroyedResetFailed, DestroyedPoolClosed };

    VirtualMachinePool(PoolConfig config,
                       std::shared_ptr<IVirtualizationBackend> backend,
                       std::shared_ptr<ISnapshotService> snapshots);
    ~VirtualMachinePool();

    VirtualMachinePool(const VirtualMachinePool&) = delete;
    VirtualMachinePool& operator=(const VirtualMachinePool&) = delete;

    /**
     * Boots minSize machines concurrently and starts the maintenance loop.
     * Individual creation failures are logged and do not abort the batch.
     *
     * @return number of machines available once the batch has finished
     */
    std::size_t initialize();

    /**
     * Hands out a ready machine, waiting up to `timeout` for one to appear.
     *
     * @throws PoolExhaustedError when the deadline passes with nothing to hand out
     * @throws PoolStateError when the pool is not Ready
     */
    [[nodiscard]] std::unique_ptr<PooledMachine> acquire(std::chrono::milliseconds timeout);

    /**
     * Takes a machine back. It is reset to its golden snapshot and re-queued,
     * or destroyed when the reset fails, the pool is full or shutting down.
     *
     * @throws PoolMisuseError for a machine this pool did not hand out
     */
    ReleaseOutcome release(std::unique_ptr<PooledMachine> machine);

    // One maintenance pass: TTL eviction first, then refill towards minSize.
    MaintenanceReport runMaintenanceCycle();

    void shutdown();

    [[nodiscard]] State state() const;
    [[nodiscard]] std::size_t availableCount() const;
    [[nodiscard]] std::size_t checkedOutCount() const;
    [[nodiscard]] PoolStats stats() const;
    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::unique_ptr<PooledMachine> createMachine();
    void createIntoPool();
    void resetToGolden(PooledMachine& pooled);
    void destroyHandle(IMachineHandle& machine, std::string_view reason);
    void evictAsync(std::unique_ptr<PooledMachine> pooled);

    // Reserves up to `wanted` creation slots within maxSize; caller holds mutex_.
    std::size_t reserveCreations(std::size_t wanted);
    // Reserves enough creations to bring the pool back to minSize; caller holds mutex_.
    std::size_t reserveRefill();
    void launchCreations(std::size_t count);
    void finishBackgroundTask();

    void scheduleMaintenance();
    void maintenanceTick();

    [[nodiscard]] bool acceptingMachines() const noexcept;
    [[nodiscard]] bool isStale(const PooledMachine& pooled,
                               std::chrono::steady_clock::time_point now) const noexcept;

    [[nodiscard]] static std::string generate_uuid();

    PoolConfig config_;
    std::shared_ptr<IVirtualizationBackend> backend_;
    std::shared_ptr<ISnapshotService> snapshots_;
    StateWaiter waiter_;

    mutable std::mutex mutex_;
    std::condition_variable availableCv_;
    std::condition_variable idleCv_;
    std::deque<std::unique_ptr<PooledMachine>> available_;
    // Keyed by address: ids are only unique within one pool.
    std::unordered_set<const PooledMachine*> checkedOut_;
    std::size_t pending_{0};
    std::size_t backgroundTasks_{0};
    State state_{State::Uninitialized};

    std::atomic<std::uint64_t> nextId_{1};
    std::atomic<std::uint64_t> acquisitions_{0};
    std::atomic<std::int64_t> acquireNanos_{0};
    std::atomic<std::uint64_t> creationFailures_{0};
    std::atomic<std::uint64_t> resetFailures_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> destroyed_{0};

    // Declared before the timer: a Timer must not outlive its io_context.
    std::unique_ptr<CONCURRENCY::EventDispatcher> dispatcher_;
    std::shared_ptr<CONCURRENCY::Timer> maintenanceTimer_;
};

[[nodiscard]] std::string_view toString(VirtualMachinePool::State state) noexcept;
[[nodiscard]] std::string_view toString(VirtualMachinePool::ReleaseOutcome outcome) noexcept;
