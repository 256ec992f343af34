#pragma once

#include "Core/interfaces/IMachineHandle.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <libvirt/libvirt.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief IMachineHandle over a libvirt domain.
 *
 * Owns the virDomainPtr. Lifecycle failures throw LibvirtException.
 */
class VirtualMachine : public IMachineHandle {
public:
    VirtualMachine(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom);
    ~VirtualMachine() override;

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    // Looks up an existing domain; throws VmException when it does not exist.
    [[nodiscard]] static std::unique_ptr<VirtualMachine> lookup(std::shared_ptr<HypervisorConnector> conn,
                                                                std::string_view vmName);

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] const std::string& uuid() const noexcept override { return uuid_; }

    // No-op when the domain is already active.
    void start() override;
    // No-op when the domain is already inactive.
    void stop(bool graceful) override;
    void destroy() override;

    [[nodiscard]] VmState getState() const override;
    [[nodiscard]] bool isActive() const;

    // Guest CID assigned to the vsock device, read from the live domain XML.
    [[nodiscard]] std::optional<std::uint32_t> vsockCid() const;

    [[nodiscard]] virDomainPtr getRawHandle() const noexcept { return domain; }

    [[nodiscard]] static VmState mapLibvirtState(int state) noexcept;

private:
    void checkLibvirtError(int result, const std::string& action) const;

    std::shared_ptr<HypervisorConnector> connector;
    virDomainPtr domain{nullptr};
    std::string name_;
    std::string uuid_;
    bool undefined_{false};
};
