#pragma once

#include "Core/interfaces/ISnapshotService.hpp"
#include <libvirt/libvirt.h>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief ISnapshotService over libvirt internal snapshots.
 *
 * Snapshot ids are libvirt snapshot names. Only machines created by the
 * libvirt backend (VirtualMachine) are accepted.
 */
class SnapshotManager : public ISnapshotService {
public:
    SnapshotManager() = default;
    ~SnapshotManager() override = default;

    [[nodiscard]] SnapshotId createSnapshot(IMachineHandle& machine,
                                            std::string_view name,
                                            std::string_view description) override;
    void restoreSnapshot(IMachineHandle& machine, const SnapshotId& snapshot) override;
    [[nodiscard]] std::vector<SnapshotId> listSnapshots(IMachineHandle& machine) override;

    [[nodiscard]] static std::string buildSnapshotXML(std::string_view name, std::string_view description);

private:
    [[nodiscard]] static virDomainPtr domainOf(IMachineHandle& machine);
};
