#include "Virtualization/vm/VirtualMachine.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <libvirt/virterror.h>
#include <pugixml.hpp>
#include <cstdlib>

VirtualMachine::VirtualMachine(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom)
    : connector(std::move(conn)), domain(dom) {
    if (!domain) throw VmException("VirtualMachine requires a domain handle");

    const char* domainName = virDomainGetName(domain);
    name_ = domainName ? domainName : "";

    char uuidBuf[VIR_UUID_STRING_BUFLEN] = {};
    if (virDomainGetUUIDString(domain, uuidBuf) == 0) {
        uuid_ = uuidBuf;
    }
}

VirtualMachine::~VirtualMachine() {
    if (domain) virDomainFree(domain);
}

std::unique_ptr<VirtualMachine> VirtualMachine::lookup(std::shared_ptr<HypervisorConnector> conn,
                                                       std::string_view vmName) {
    const std::string wanted(vmName);
    virDomainPtr dom = virDomainLookupByName(conn->ensureConnected(), wanted.c_str());
    if (!dom) throw VmException("VM not found: " + wanted);
    return std::make_unique<VirtualMachine>(std::move(conn), dom);
}

void VirtualMachine::start() {
    if (isActive()) {
        AH_LOG_DEBUG("VM {} already running", name_);
        return;
    }
    checkLibvirtError(virDomainCreate(domain), "start");
    AH_LOG_INFO("VM {} started", name_);
}

void VirtualMachine::stop(bool graceful) {
    if (!isActive()) {
        AH_LOG_DEBUG("VM {} already stopped", name_);
        return;
    }
    if (graceful) {
        checkLibvirtError(virDomainShutdown(domain), "shutdown");
    } else {
        checkLibvirtError(virDomainDestroy(domain), "force stop");
    }
    AH_LOG_INFO("VM {} {}", name_, graceful ? "shutdown requested" : "force stopped");
}

void VirtualMachine::destroy() {
    if (undefined_) return;
    if (isActive()) {
        checkLibvirtError(virDomainDestroy(domain), "destroy");
    }
    const unsigned int flags = VIR_DOMAIN_UNDEFINE_SNAPSHOTS_METADATA | VIR_DOMAIN_UNDEFINE_MANAGED_SAVE;
    checkLibvirtError(virDomainUndefineFlags(domain, flags), "undefine");
    undefined_ = true;
    AH_LOG_INFO("VM {} undefined", name_);
}

VmState VirtualMachine::getState() const {
    int s = 0;
    if (virDomainGetState(domain, &s, nullptr, 0) < 0) return VmState::Unknown;
    return mapLibvirtState(s);
}

bool VirtualMachine::isActive() const {
    const int active = virDomainIsActive(domain);
    if (active < 0) {
        throw LibvirtException("query active state of " + name_ + ": " + lastLibvirtError());
    }
    return active == 1;
}

std::optional<std::uint32_t> VirtualMachine::vsockCid() const {
    char* xml = virDomainGetXMLDesc(domain, 0);
    if (!xml) {
        throw LibvirtException("read XML of " + name_ + ": " + lastLibvirtError());
    }
    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_string(xml);
    std::free(xml);
    if (!parsed) {
        throw LibvirtException("parse XML of " + name_ + ": " + parsed.description());
    }

    const pugi::xml_attribute address = doc.child("domain").child("devices").child("vsock").child("cid").attribute("address");
    if (!address) return std::nullopt;
    const unsigned int cid = address.as_uint(0);
    if (cid == 0) return std::nullopt;
    return static_cast<std::uint32_t>(cid);
}

void VirtualMachine::checkLibvirtError(int result, const std::string& action) const {
    if (result < 0) {
        throw LibvirtException(action + " " + name_ + ": " + lastLibvirtError());
    }
}

VmState VirtualMachine::mapLibvirtState(int state) noexcept {
    switch (state) {
        case VIR_DOMAIN_NOSTATE:     return VmState::Unknown;
        case VIR_DOMAIN_RUNNING:
        case VIR_DOMAIN_BLOCKED:     return VmState::Running;
        case VIR_DOMAIN_PAUSED:
        case VIR_DOMAIN_PMSUSPENDED: return VmState::Paused;
        case VIR_DOMAIN_SHUTDOWN:    return VmState::ShuttingDown;
        case VIR_DOMAIN_SHUTOFF:     return VmState::Stopped;
        case VIR_DOMAIN_CRASHED:     return VmState::Crashed;
        default:                     return VmState::Unknown;
    }
}
