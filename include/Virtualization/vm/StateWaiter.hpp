#pragma once

#include "Core/interfaces/IMachineHandle.hpp"
#include "Utils/Exception.hpp"
#include <chrono>
#include <functional>
#include <string>

class StateTimeoutError : public TimeoutError {
public:
    StateTimeoutError(VmState target, VmState lastObserved, std::chrono::milliseconds timeout);

    [[nodiscard]] VmState target() const noexcept { return target_; }
    [[nodiscard]] VmState lastObserved() const noexcept { return lastObserved_; }

private:
    VmState target_;
    VmState lastObserved_;
};

/**
 * @brief Polls a machine until it reports a target state.
 *
 * The pause between polls starts at the initial interval and doubles after
 * every miss up to the ceiling: 50, 100, 200, 400, 500, 500 ... ms with the
 * defaults. A wait that never sees the target throws StateTimeoutError no
 * later than timeout + one ceiling interval after the call.
 */
class StateWaiter {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit StateWaiter(std::chrono::milliseconds initialInterval = std::chrono::milliseconds(50),
                         std::chrono::milliseconds maxInterval = std::chrono::milliseconds(500),
                         Sleeper sleeper = nullptr);

    void waitForState(const IMachineHandle& machine, VmState target, std::chrono::milliseconds timeout) const;

    [[nodiscard]] static std::chrono::milliseconds nextInterval(std::chrono::milliseconds current,
                                                                std::chrono::milliseconds ceiling) noexcept;

    [[nodiscard]] std::chrono::milliseconds initialInterval() const noexcept { return initial_; }
    [[nodiscard]] std::chrono::milliseconds maxInterval() const noexcept { return max_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    Sleeper sleeper_;
};
