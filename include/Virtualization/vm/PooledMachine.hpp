#pragma once

#include "Core/interfaces/IMachineHandle.hpp"
#include "Core/interfaces/ISnapshotService.hpp"
#include <chrono>
#include <cstdint>
#include <memory>

// A machine plus the bookkeeping the pool needs to recycle it.
struct PooledMachine {
    std::uint64_t id{0};
    std::unique_ptr<IMachineHandle> machine;
    std::chrono::steady_clock::time_point createdAt;
    SnapshotId goldenSnapshotId;

    [[nodiscard]] IMachineHandle& handle() const noexcept { return *machine; }
    [[nodiscard]] const std::string& name() const noexcept { return machine->name(); }

    [[nodiscard]] std::chrono::steady_clock::duration age(
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const noexcept {
        return now - createdAt;
    }
};
