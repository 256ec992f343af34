#pragma once

#include <string>
#include <string_view>

enum class VmState { Creating, Running, Paused, ShuttingDown, Stopped, Crashed, Unknown };

[[nodiscard]] constexpr std::string_view toString(VmState state) noexcept {
    switch (state) {
        case VmState::Creating:     return "creating";
        case VmState::Running:      return "running";
        case VmState::Paused:       return "paused";
        case VmState::ShuttingDown: return "shutting-down";
        case VmState::Stopped:      return "stopped";
        case VmState::Crashed:      return "crashed";
        case VmState::Unknown:      return "unknown";
    }
    return "unknown";
}

/**
 * @brief Reference to one virtual machine owned by a virtualization backend.
 *
 * Lifecycle calls throw VmException (or a subclass) on backend failure.
 * Identity is stable for the lifetime of the machine.
 */
class IMachineHandle {
public:
    virtual ~IMachineHandle() noexcept = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual const std::string& uuid() const noexcept = 0;

    virtual void start() = 0;
    virtual void stop(bool graceful) = 0;
    // Releases every backend resource of the machine; the handle is dead afterwards.
    virtual void destroy() = 0;

    [[nodiscard]] virtual VmState getState() const = 0;
};
