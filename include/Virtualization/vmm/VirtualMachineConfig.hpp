#ifndef VMCONFIG_H
#define VMCONFIG_H

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

enum class NetworkMode { NatFiltered, Isolated, Bridge };

[[nodiscard]] std::string_view toString(NetworkMode mode) noexcept;

// Shape of every machine the pool creates. `name` is filled in per machine.
struct MachineTemplate {
    std::string name;
    std::string namePrefix = "pool-vm";
    std::string arch = "x86_64";
    std::string osType = "hvm";

    // resources
    unsigned int vcpus = 2;
    unsigned long memoryMiB = 2048;

    // storage and network
    // Empty -> /var/lib/libvirt/images/<name>.qcow2. "{name}" is replaced by the
    // machine name; a path without it is one image shared by every machine.
    std::string diskPath;
    NetworkMode network = NetworkMode::NatFiltered;
    bool enableVsock = true;

    static constexpr std::string_view kNamePlaceholder = "{name}";

    [[nodiscard]] std::string resolvedDiskPath() const;
    [[nodiscard]] bool sharesDiskImage() const noexcept;
    [[nodiscard]] bool validate() const;
};

struct PoolConfig {
    std::size_t minSize = 5;
    std::size_t maxSize = 20;
    std::chrono::seconds ttl{3600};
    std::chrono::milliseconds maintenanceInterval{10000};

    std::chrono::milliseconds bootTimeout{30000};
    std::chrono::milliseconds resetTimeout{30000};
    std::chrono::milliseconds stopTimeout{10000};

    // state polling backoff
    std::chrono::milliseconds initialPollInterval{50};
    std::chrono::milliseconds maxPollInterval{500};

    // When set, acquire() boots a machine outside the pool's size accounting
    // once its wait deadline passes instead of failing with PoolExhaustedError.
    bool createOnDemand = false;

    MachineTemplate machine;

    // Throws PoolConfigError naming the first invalid field.
    void validate() const;
};

#endif // VMCONFIG_H
