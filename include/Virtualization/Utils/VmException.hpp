#pragma once
#include <stdexcept>
#include <string>

class VmException : public std::runtime_error {
public:
    explicit VmException(const std::string& msg) : std::runtime_error("[VmException] " + msg) {}
};

class LibvirtException : public VmException {
public:
    explicit LibvirtException(const std::string& msg) : VmException("[Libvirt] " + msg) {}
};

class SnapshotException : public VmException {
public:
    explicit SnapshotException(const std::string& msg) : VmException("[Snapshot] " + msg) {}
};

class PoolConfigError : public VmException {
public:
    explicit PoolConfigError(const std::string& msg) : VmException("[PoolConfig] " + msg) {}
};

class PoolStateError : public VmException {
public:
    explicit PoolStateError(const std::string& msg) : VmException("[PoolState] " + msg) {}
};

// acquire() reached its deadline with no machine to hand out.
class PoolExhaustedError : public VmException {
public:
    explicit PoolExhaustedError(const std::string& msg) : VmException("[PoolExhausted] " + msg) {}
};

// release() of a machine this pool did not hand out, or already took back.
class PoolMisuseError : public VmException {
public:
    explicit PoolMisuseError(const std::string& msg) : VmException("[PoolMisuse] " + msg) {}
};

class ResetFailureError : public VmException {
public:
    explicit ResetFailureError(const std::string& msg) : VmException("[ResetFailure] " + msg) {}
};
