#pragma once

#include "Core/interfaces/IMachineHandle.hpp"
#include <string>
#include <string_view>
#include <vector>

using SnapshotId = std::string;

class ISnapshotService {
public:
    virtual ~ISnapshotService() noexcept = default;

    [[nodiscard]] virtual SnapshotId createSnapshot(IMachineHandle& machine,
                                                    std::string_view name,
                                                    std::string_view description) = 0;

    // Throws SnapshotException when the snapshot cannot be restored.
    virtual void restoreSnapshot(IMachineHandle& machine, const SnapshotId& snapshot) = 0;

    [[nodiscard]] virtual std::vector<SnapshotId> listSnapshots(IMachineHandle& machine) = 0;
};
