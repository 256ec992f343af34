#include "Virtualization/vm/VirtualMachinePool.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <iterator>
#include <utility>

using clock_type = std::chrono::steady_clock;

std::string_view toString(VirtualMachinePool::State state) noexcept {
    switch (state) {
        case VirtualMachinePool::State::Uninitialized: return "uninitialized";
        case VirtualMachinePool::State::Initializing:  return "initializing";
        case VirtualMachinePool::State::Ready:         return "ready";
        case VirtualMachinePool::State::Draining:      return "draining";
        case VirtualMachinePool::State::Shutdown:      return "shutdown";
    }
    return "unknown";
}

std::string_view toString(VirtualMachinePool::ReleaseOutcome outcome) noexcept {
    switch (outcome) {
        case VirtualMachinePool::ReleaseOutcome::Returned:             return "returned";
        case VirtualMachinePool::ReleaseOutcome::DestroyedPoolFull:    return "destroyed-pool-full";
        case VirtualMachinePool::ReleaseOutcome::DestroyedResetFailed: return "destroyed-reset-failed";
        case VirtualMachinePool::ReleaseOutcome::DestroyedPoolClosed:  return "destroyed-pool-closed";
    }
    return "unknown";
}

VirtualMachinePool::VirtualMachinePool(PoolConfig config,
                                       std::shared_ptr<IVirtualizationBackend> backend,
                                       std::shared_ptr<ISnapshotService> snapshots)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      snapshots_(std::move(snapshots)),
      waiter_(config_.initialPollInterval, config_.maxPollInterval)
{
    config_.validate();
    if (!backend_) throw PoolConfigError("virtualization backend is required");
    if (!snapshots_) throw PoolConfigError("snapshot service is required");

    // One thread per creation slot, plus room for the maintenance tick and deferred destroys.
    dispatcher_ = std::make_unique<CONCURRENCY::EventDispatcher>(config_.maxSize + 2);
    AH_LOG_INFO("VirtualMachinePool created (min: {}, max: {}, ttl: {}s)",
                config_.minSize, config_.maxSize, config_.ttl.count());
}

VirtualMachinePool::~VirtualMachinePool() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        AH_LOG_ERROR("VirtualMachinePool shutdown during destruction failed: {}", e.what());
    }
}

std::size_t VirtualMachinePool::initialize() {
    std::size_t reserved = 0;
    {
        std::lock_guard lock(mutex_);
        if (state_ == State::Ready) {
            AH_LOG_DEBUG("Pool already initialized");
            return available_.size();
        }
        if (state_ != State::Uninitialized) {
            throw PoolStateError("initialize() called while pool is " + std::string(toString(state_)));
        }
        state_ = State::Initializing;
        reserved = reserveCreations(config_.minSize);
    }

    AH_LOG_INFO("Pool initializing: creating {} machines", reserved);
    const auto started = clock_type::now();
    launchCreations(reserved);

    std::size_t ready = 0;
    {
        std::unique_lock lock(mutex_);
        idleCv_.wait(lock, [this] { return pending_ == 0; });
        if (state_ != State::Initializing) {
            throw PoolStateError("pool was shut down during initialization");
        }
        state_ = State::Ready;
        ready = available_.size();
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - started);
    if (ready < config_.minSize) {
        AH_LOG_WARN("Pool initialized below minimum: {}/{} machines in {}ms", ready, config_.minSize, elapsed.count());
    } else {
        AH_LOG_INFO("Pool initialized: {} machines in {}ms", ready, elapsed.count());
    }

    scheduleMaintenance();
    return ready;
}

std::unique_ptr<PooledMachine> VirtualMachinePool::acquire(std::chrono::milliseconds timeout) {
    const auto started = clock_type::now();
    const auto deadline = started + timeout;

    std::unique_ptr<PooledMachine> picked;
    {
        std::unique_lock lock(mutex_);
        if (state_ != State::Ready) {
            throw PoolStateError("acquire() called while pool is " + std::string(toString(state_)));
        }

        while (true) {
            const auto now = clock_type::now();
            std::size_t expired = 0;
            while (!available_.empty()) {
                auto candidate = std::move(available_.front());
                available_.pop_front();
                if (isStale(*candidate, now)) {
                    AH_LOG_INFO("VM stale at acquire, evicting: {}", candidate->name());
                    ++backgroundTasks_;
                    evictAsync(std::move(candidate));
                    ++expired;
                    continue;
                }
                picked = std::move(candidate);
                break;
            }
            // Replacements for evicted machines boot while this caller waits.
            if (expired > 0) launchCreations(reserveRefill());

            if (picked || state_ != State::Ready) break;
            if (availableCv_.wait_until(lock, deadline) == std::cv_status::timeout && available_.empty()) break;
        }

        if (picked) checkedOut_.insert(picked.get());
    }

    if (!picked) {
        if (state() != State::Ready) {
            throw PoolStateError("pool shut down while waiting in acquire()");
        }
        if (!config_.createOnDemand) {
            AH_LOG_WARN("Pool exhausted: no machine within {}ms", timeout.count());
            throw PoolExhaustedError("no machine available within " + std::to_string(timeout.count()) +
                                     "ms, retry later");
        }

        AH_LOG_WARN("Pool empty after {}ms, creating machine on demand", timeout.count());
        try {
            picked = createMachine();
        } catch (const std::exception& e) {
            creationFailures_++;
            throw PoolExhaustedError(std::string("on-demand creation failed: ") + e.what());
        }

        bool open = false;
        {
            std::lock_guard lock(mutex_);
            open = state_ == State::Ready;
            if (open) checkedOut_.insert(picked.get());
        }
        if (!open) {
            destroyHandle(picked->handle(), "pool closed during on-demand creation");
            throw PoolStateError("pool shut down during on-demand creation");
        }
    }

    const auto elapsed = clock_type::now() - started;
    acquisitions_++;
    acquireNanos_ += std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
    AH_LOG_INFO("VM acquired: {} ({}us)", picked->name(),
                std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    return picked;
}

VirtualMachinePool::ReleaseOutcome VirtualMachinePool::release(std::unique_ptr<PooledMachine> machine) {
    if (!machine || !machine->machine) {
        throw PoolMisuseError("release() of an empty machine");
    }

    bool open = false;
    {
        std::lock_guard lock(mutex_);
        auto it = checkedOut_.find(machine.get());
        if (it == checkedOut_.end()) {
            throw PoolMisuseError("machine '" + machine->name() + "' is not checked out from this pool");
        }
        checkedOut_.erase(it);
        open = acceptingMachines();
    }
    AH_LOG_INFO("VM release requested: {}", machine->name());

    if (!open) {
        destroyHandle(machine->handle(), "released after pool shutdown");
        return ReleaseOutcome::DestroyedPoolClosed;
    }

    try {
        resetToGolden(*machine);
    } catch (const ResetFailureError& e) {
        resetFailures_++;
        AH_LOG_ERROR("VM reset failed, destroying: {}", e.what());
        destroyHandle(machine->handle(), "reset failed");
        return ReleaseOutcome::DestroyedResetFailed;
    }

    ReleaseOutcome outcome = ReleaseOutcome::Returned;
    {
        std::lock_guard lock(mutex_);
        if (!acceptingMachines()) {
            outcome = ReleaseOutcome::DestroyedPoolClosed;
        } else if (available_.size() + pending_ >= config_.maxSize) {
            outcome = ReleaseOutcome::DestroyedPoolFull;
        } else {
            AH_LOG_INFO("VM returned to pool: {}", machine->name());
            available_.push_back(std::move(machine));
            availableCv_.notify_one();
            return outcome;
        }
    }

    destroyHandle(machine->handle(), toString(outcome));
    return outcome;
}

MaintenanceReport VirtualMachinePool::runMaintenanceCycle() {
    std::vector<std::unique_ptr<PooledMachine>> expired;
    MaintenanceReport report;
    {
        std::lock_guard lock(mutex_);
        if (state_ != State::Ready) return report;

        const auto now = clock_type::now();
        auto keep = std::stable_partition(available_.begin(), available_.end(),
                                          [&](const auto& pooled) { return !isStale(*pooled, now); });
        std::move(keep, available_.end(), std::back_inserter(expired));
        available_.erase(keep, available_.end());

        report.evicted = expired.size();
        report.scheduled = reserveRefill();
        if (report.scheduled > 0) {
            AH_LOG_INFO("Pool refilling: available {}, pending {}, scheduling {}",
                        available_.size(), pending_ - report.scheduled, report.scheduled);
        }
    }

    launchCreations(report.scheduled);
    for (auto& pooled : expired) {
        evictions_++;
        destroyHandle(pooled->handle(), "ttl expired");
    }
    return report;
}

void VirtualMachinePool::shutdown() {
    std::shared_ptr<CONCURRENCY::Timer> timer;
    {
        std::lock_guard lock(mutex_);
        if (state_ == State::Draining || state_ == State::Shutdown) return;
        if (state_ == State::Uninitialized) {
            state_ = State::Shutdown;
            dispatcher_->stop();
            return;
        }
        state_ = State::Draining;
        timer = std::move(maintenanceTimer_);
    }
    AH_LOG_INFO("Pool shutdown requested");
    availableCv_.notify_all();
    if (timer) timer->cancel();
    timer.reset();

    std::deque<std::unique_ptr<PooledMachine>> drained;
    {
        std::unique_lock lock(mutex_);
        idleCv_.wait(lock, [this] { return pending_ == 0 && backgroundTasks_ == 0; });
        drained.swap(available_);
    }

    for (auto& pooled : drained) {
        destroyHandle(pooled->handle(), "pool shutdown");
    }
    dispatcher_->stop();

    std::lock_guard lock(mutex_);
    state_ = State::Shutdown;
    AH_LOG_INFO("Pool shutdown complete: destroyed {} machines", drained.size());
}

VirtualMachinePool::State VirtualMachinePool::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::size_t VirtualMachinePool::availableCount() const {
    std::lock_guard lock(mutex_);
    return available_.size();
}

std::size_t VirtualMachinePool::checkedOutCount() const {
    std::lock_guard lock(mutex_);
    return checkedOut_.size();
}

PoolStats VirtualMachinePool::stats() const {
    PoolStats s;
    {
        std::lock_guard lock(mutex_);
        s.available = available_.size();
        s.checkedOut = checkedOut_.size();
        s.pending = pending_;
    }
    s.acquisitions = acquisitions_.load();
    s.totalAcquireTime = std::chrono::nanoseconds(acquireNanos_.load());
    s.creationFailures = creationFailures_.load();
    s.resetFailures = resetFailures_.load();
    s.evictions = evictions_.load();
    s.destroyed = destroyed_.load();
    return s;
}

std::unique_ptr<PooledMachine> VirtualMachinePool::createMachine() {
    MachineTemplate tmpl = config_.machine;
    tmpl.name = tmpl.namePrefix + "-" + generate_uuid();

    auto handle = backend_->createMachine(tmpl);
    if (!handle) throw VmException("backend returned no machine for " + tmpl.name);

    try {
        handle->start();
        waiter_.waitForState(*handle, VmState::Running, config_.bootTimeout);
        SnapshotId golden = snapshots_->createSnapshot(*handle, handle->name() + "-golden",
                                                       "Golden state for pool reset");

        AH_LOG_INFO("VM created: {} (snapshot: {})", handle->name(), golden);
        auto pooled = std::make_unique<PooledMachine>();
        pooled->id = nextId_++;
        pooled->createdAt = clock_type::now();
        pooled->goldenSnapshotId = std::move(golden);
        pooled->machine = std::move(handle);
        return pooled;
    } catch (const std::exception& e) {
        AH_LOG_ERROR("VM creation failed for '{}': {}", tmpl.name, e.what());
        destroyHandle(*handle, "creation failed");
        throw;
    }
}

void VirtualMachinePool::createIntoPool() {
    std::unique_ptr<PooledMachine> fresh;
    try {
        fresh = createMachine();
    } catch (const std::exception& e) {
        creationFailures_++;
        AH_LOG_ERROR("Pool refill failed: {}", e.what());
    }

    bool keep = false;
    {
        std::lock_guard lock(mutex_);
        --pending_;
        if (fresh && acceptingMachines()) {
            available_.push_back(std::move(fresh));
            availableCv_.notify_one();
            keep = true;
        }
        idleCv_.notify_all();
    }

    if (fresh && !keep) {
        destroyHandle(fresh->handle(), "pool closed before machine was ready");
    }
    finishBackgroundTask();
}

void VirtualMachinePool::resetToGolden(PooledMachine& pooled) {
    try {
        const auto snapshots = snapshots_->listSnapshots(pooled.handle());
        if (std::find(snapshots.begin(), snapshots.end(), pooled.goldenSnapshotId) == snapshots.end()) {
            throw SnapshotException("golden snapshot '" + pooled.goldenSnapshotId + "' not found");
        }
        snapshots_->restoreSnapshot(pooled.handle(), pooled.goldenSnapshotId);
        waiter_.waitForState(pooled.handle(), VmState::Running, config_.resetTimeout);
    } catch (const std::exception& e) {
        throw ResetFailureError(pooled.name() + ": " + e.what());
    }
    AH_LOG_INFO("VM reset to golden: {} ({})", pooled.name(), pooled.goldenSnapshotId);
}

void VirtualMachinePool::destroyHandle(IMachineHandle& machine, std::string_view reason) {
    try {
        if (machine.getState() != VmState::Stopped) {
            machine.stop(false);
            waiter_.waitForState(machine, VmState::Stopped, config_.stopTimeout);
        }
    } catch (const std::exception& e) {
        AH_LOG_WARN("VM '{}' did not stop cleanly: {}", machine.name(), e.what());
    }

    try {
        machine.destroy();
        AH_LOG_INFO("VM destroyed: {} ({})", machine.name(), reason);
    } catch (const std::exception& e) {
        AH_LOG_ERROR("VM destroy failed for '{}', dropping it: {}", machine.name(), e.what());
    }
    destroyed_++;
}

void VirtualMachinePool::evictAsync(std::unique_ptr<PooledMachine> pooled) {
    evictions_++;
    auto shared = std::shared_ptr<PooledMachine>(std::move(pooled));
    dispatcher_->dispatch([this, shared]() {
        destroyHandle(shared->handle(), "ttl expired");
        finishBackgroundTask();
    });
}

std::size_t VirtualMachinePool::reserveCreations(std::size_t wanted) {
    const std::size_t occupied = available_.size() + pending_;
    const std::size_t room = occupied >= config_.maxSize ? 0 : config_.maxSize - occupied;
    const std::size_t count = std::min(wanted, room);
    pending_ += count;
    backgroundTasks_ += count;
    return count;
}

std::size_t VirtualMachinePool::reserveRefill() {
    const std::size_t occupied = available_.size() + pending_;
    if (occupied >= config_.minSize) return 0;
    return reserveCreations(config_.minSize - occupied);
}

void VirtualMachinePool::launchCreations(std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        dispatcher_->dispatch([this]() { createIntoPool(); });
    }
}

void VirtualMachinePool::finishBackgroundTask() {
    std::lock_guard lock(mutex_);
    --backgroundTasks_;
    idleCv_.notify_all();
}

void VirtualMachinePool::scheduleMaintenance() {
    std::lock_guard lock(mutex_);
    if (state_ != State::Ready) return;
    maintenanceTimer_ = dispatcher_->dispatch_delayed(config_.maintenanceInterval, [this]() { maintenanceTick(); });
}

void VirtualMachinePool::maintenanceTick() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != State::Ready) return;
        ++backgroundTasks_;
    }
    try {
        const auto report = runMaintenanceCycle();
        if (report.evicted > 0 || report.scheduled > 0) {
            AH_LOG_INFO("Pool maintenance: evicted {}, scheduled {}", report.evicted, report.scheduled);
        }
    } catch (const std::exception& e) {
        AH_LOG_ERROR("Pool maintenance error: {}", e.what());
    }
    finishBackgroundTask();
    scheduleMaintenance();
}

bool VirtualMachinePool::acceptingMachines() const noexcept {
    return state_ == State::Initializing || state_ == State::Ready;
}

bool VirtualMachinePool::isStale(const PooledMachine& pooled, clock_type::time_point now) const noexcept {
    return pooled.age(now) > config_.ttl;
}

std::string VirtualMachinePool::generate_uuid() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}
