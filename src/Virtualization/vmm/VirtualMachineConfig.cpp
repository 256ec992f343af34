#include "Virtualization/vmm/VirtualMachineConfig.hpp"
#include "Virtualization/Utils/VmException.hpp"

std::string_view toString(NetworkMode mode) noexcept {
    switch (mode) {
        case NetworkMode::NatFiltered: return "nat-filtered";
        case NetworkMode::Isolated:    return "isolated";
        case NetworkMode::Bridge:      return "bridge";
    }
    return "nat-filtered";
}

std::string MachineTemplate::resolvedDiskPath() const {
    if (diskPath.empty()) return "/var/lib/libvirt/images/" + name + ".qcow2";

    std::string path = diskPath;
    for (auto pos = path.find(kNamePlaceholder); pos != std::string::npos;
         pos = path.find(kNamePlaceholder, pos + name.size())) {
        path.replace(pos, kNamePlaceholder.size(), name);
    }
    return path;
}

bool MachineTemplate::sharesDiskImage() const noexcept {
    return !diskPath.empty() && diskPath.find(kNamePlaceholder) == std::string::npos;
}

bool MachineTemplate::validate() const {
    if (namePrefix.empty() && name.empty()) return false;
    if (memoryMiB == 0 || vcpus == 0) return false;
    if (arch.empty() || osType.empty()) return false;
    return true;
}

void PoolConfig::validate() const {
    if (maxSize < 1) throw PoolConfigError("max_size must be at least 1");
    if (minSize > maxSize) throw PoolConfigError("min_size cannot exceed max_size");
    if (ttl.count() <= 0) throw PoolConfigError("ttl must be positive");
    if (maintenanceInterval.count() <= 0) throw PoolConfigError("maintenance interval must be positive");
    if (bootTimeout.count() <= 0 || resetTimeout.count() <= 0 || stopTimeout.count() <= 0) {
        throw PoolConfigError("boot, reset and stop timeouts must be positive");
    }
    if (initialPollInterval.count() <= 0 || maxPollInterval < initialPollInterval) {
        throw PoolConfigError("poll intervals must be positive and initial <= max");
    }
    if (!machine.validate()) throw PoolConfigError("machine template is invalid");
    // Two running domains cannot open the same qcow2 image.
    if (machine.sharesDiskImage() && (maxSize > 1 || createOnDemand)) {
        throw PoolConfigError("disk image '" + machine.diskPath +
                              "' would be shared; use max_size 1 without on-demand creation, or a "
                              "path containing {name}");
    }
}
