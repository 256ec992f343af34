#include "Virtualization/vm/StateWaiter.hpp"
#include "System/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

StateTimeoutError::StateTimeoutError(VmState target, VmState lastObserved, std::chrono::milliseconds timeout)
    : TimeoutError("waiting for state " + std::string(toString(target)) + " (current: " +
                   std::string(toString(lastObserved)) + ", timeout: " + std::to_string(timeout.count()) + "ms)"),
      target_(target), lastObserved_(lastObserved) {}

StateWaiter::StateWaiter(std::chrono::milliseconds initialInterval,
                         std::chrono::milliseconds maxInterval,
                         Sleeper sleeper)
    : initial_(initialInterval), max_(maxInterval), sleeper_(std::move(sleeper)) {
    if (initial_.count() <= 0 || max_ < initial_) {
        throw std::invalid_argument("StateWaiter: intervals must be positive and initial <= max");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds StateWaiter::nextInterval(std::chrono::milliseconds current,
                                                    std::chrono::milliseconds ceiling) noexcept {
    return std::min(current * 2, ceiling);
}

void StateWaiter::waitForState(const IMachineHandle& machine, VmState target, std::chrono::milliseconds timeout) const {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    auto interval = initial_;

    while (true) {
        const VmState current = machine.getState();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);

        if (current == target) {
            AH_LOG_DEBUG("VM '{}' reached {} after {}ms", machine.name(), toString(target), elapsed.count());
            return;
        }
        if (elapsed > timeout) {
            AH_LOG_WARN("VM '{}' did not reach {} within {}ms (current: {})",
                        machine.name(), toString(target), timeout.count(), toString(current));
            throw StateTimeoutError(target, current, timeout);
        }

        sleeper_(interval);
        interval = nextInterval(interval, max_);
    }
}
