#pragma once

#include "Core/interfaces/IMachineHandle.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"
#include <memory>

class IVirtualizationBackend {
public:
    virtual ~IVirtualizationBackend() noexcept = default;

    // Defines a new machine from the template. The machine is not started.
    [[nodiscard]] virtual std::unique_ptr<IMachineHandle> createMachine(const MachineTemplate& tmpl) = 0;
};
