#pragma once

#include <libvirt/libvirt.h>
#include <mutex>
#include <string>

/**
 * @brief Owns the libvirt connection shared by the backend and snapshot adapters.
 */
class HypervisorConnector {
public:
    static constexpr const char* kDefaultUri = "qemu:///system";

    explicit HypervisorConnector(std::string uri = kDefaultUri);
    ~HypervisorConnector();

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    bool connect() noexcept;
    // Throws LibvirtException with libvirt's last error message.
    void connectOrThrow();
    void close() noexcept;

    [[nodiscard]] virConnectPtr getRawHandle() const noexcept;
    [[nodiscard]] virConnectPtr ensureConnected();
    [[nodiscard]] bool isConnected() const noexcept;
    // Asks libvirt whether the connection still works (keepalive for remote URIs).
    [[nodiscard]] bool isAlive() const noexcept;
    [[nodiscard]] const std::string& uri() const noexcept { return uri_; }

private:
    mutable std::mutex mutex_;
    virConnectPtr conn{nullptr};
    std::string uri_;
};

// libvirt's last error as text, "unknown" when none is set.
[[nodiscard]] std::string lastLibvirtError();
