#pragma once
#include <libvirt/libvirt.h>
#include <memory>
#include <string>
#include "Core/interfaces/IVirtualizationBackend.hpp"
#include "Utils/Result.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

/**
 * @brief Libvirt backend: turns a MachineTemplate into a defined (stopped) domain.
 */
class VirtualMachineFactory : public IVirtualizationBackend
{
public:
    explicit VirtualMachineFactory(std::shared_ptr<HypervisorConnector> conn);
    ~VirtualMachineFactory() override;

    // Throws LibvirtException when the XML cannot be built or the domain cannot be defined.
    [[nodiscard]] std::unique_ptr<IMachineHandle> createMachine(const MachineTemplate& tmpl) override;

    [[nodiscard]] Result<std::string> buildDomainXML(const MachineTemplate& tmpl) const;
    [[nodiscard]] Result<virDomainPtr> defineDomain(const std::string& xml);

private:
    std::shared_ptr<HypervisorConnector> connector;
};
