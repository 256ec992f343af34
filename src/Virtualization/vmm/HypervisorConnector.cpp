#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <libvirt/virterror.h>

std::string lastLibvirtError() {
    virErrorPtr e = virGetLastError();
    return (e && e->message) ? e->message : "unknown";
}

HypervisorConnector::HypervisorConnector(std::string uri)
    : uri_(std::move(uri)) {}

HypervisorConnector::~HypervisorConnector() {
    close();
}

bool HypervisorConnector::connect() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) return true;
    conn = virConnectOpen(uri_.c_str());
    if (conn) {
        AH_LOG_NOTHROW(info, "Connected to hypervisor at {}", uri_);
    }
    return conn != nullptr;
}

void HypervisorConnector::connectOrThrow() {
    if (!connect()) {
        throw LibvirtException("connect to " + uri_ + " failed: " + lastLibvirtError());
    }
}

void HypervisorConnector::close() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) {
        virConnectClose(conn);
        conn = nullptr;
        AH_LOG_NOTHROW(debug, "Hypervisor connection {} closed", uri_);
    }
}

virConnectPtr HypervisorConnector::getRawHandle() const noexcept {
    std::scoped_lock lock(mutex_);
    return conn;
}

virConnectPtr HypervisorConnector::ensureConnected() {
    connectOrThrow();
    return getRawHandle();
}

bool HypervisorConnector::isConnected() const noexcept {
    std::scoped_lock lock(mutex_);
    return conn != nullptr;
}

bool HypervisorConnector::isAlive() const noexcept {
    std::scoped_lock lock(mutex_);
    return conn != nullptr && virConnectIsAlive(conn) == 1;
}
