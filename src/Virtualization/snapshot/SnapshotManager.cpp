#include "Virtualization/snapshot/SnapshotManager.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <libvirt/virterror.h>
#include <pugixml.hpp>
#include <cstdlib>
#include <sstream>

namespace {

// Frees a libvirt snapshot handle on scope exit.
struct SnapshotHandle {
    virDomainSnapshotPtr ptr{nullptr};
    ~SnapshotHandle() {
        if (ptr) virDomainSnapshotFree(ptr);
    }
};

} // namespace

std::string SnapshotManager::buildSnapshotXML(std::string_view name, std::string_view description) {
    pugi::xml_document doc;
    auto root = doc.append_child("domainsnapshot");
    root.append_child("name").text() = std::string(name).c_str();
    root.append_child("description").text() = std::string(description).c_str();

    std::ostringstream out;
    doc.save(out, "", pugi::format_raw | pugi::format_no_declaration);
    return out.str();
}

virDomainPtr SnapshotManager::domainOf(IMachineHandle& machine) {
    auto* vm = dynamic_cast<VirtualMachine*>(&machine);
    if (!vm || !vm->getRawHandle()) {
        throw SnapshotException("machine " + machine.name() + " is not a libvirt domain");
    }
    return vm->getRawHandle();
}

SnapshotId SnapshotManager::createSnapshot(IMachineHandle& machine,
                                           std::string_view name,
                                           std::string_view description) {
    if (name.empty()) {
        throw SnapshotException("snapshot name must not be empty");
    }
    virDomainPtr dom = domainOf(machine);
    const std::string xml = buildSnapshotXML(name, description);

    SnapshotHandle snap{virDomainSnapshotCreateXML(dom, xml.c_str(), 0)};
    if (!snap.ptr) {
        throw SnapshotException("create '" + std::string(name) + "' on " + machine.name() + ": " + lastLibvirtError());
    }
    const char* created = virDomainSnapshotGetName(snap.ptr);
    SnapshotId id = created ? created : std::string(name);
    AH_LOG_INFO("Snapshot {} created for {}", id, machine.name());
    return id;
}

void SnapshotManager::restoreSnapshot(IMachineHandle& machine, const SnapshotId& snapshot) {
    virDomainPtr dom = domainOf(machine);

    SnapshotHandle snap{virDomainSnapshotLookupByName(dom, snapshot.c_str(), 0)};
    if (!snap.ptr) {
        throw SnapshotException("snapshot '" + snapshot + "' not found on " + machine.name() + ": " +
                                lastLibvirtError());
    }
    if (virDomainRevertToSnapshot(snap.ptr, 0) < 0) {
        throw SnapshotException("revert " + machine.name() + " to '" + snapshot + "': " + lastLibvirtError());
    }
    AH_LOG_DEBUG("VM {} reverted to snapshot {}", machine.name(), snapshot);
}

std::vector<SnapshotId> SnapshotManager::listSnapshots(IMachineHandle& machine) {
    virDomainPtr dom = domainOf(machine);

    virDomainSnapshotPtr* snaps = nullptr;
    const int count = virDomainListAllSnapshots(dom, &snaps, 0);
    if (count < 0) {
        throw SnapshotException("list snapshots of " + machine.name() + ": " + lastLibvirtError());
    }

    std::vector<SnapshotId> ids;
    ids.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        if (const char* n = virDomainSnapshotGetName(snaps[i])) {
            ids.emplace_back(n);
        }
        virDomainSnapshotFree(snaps[i]);
    }
    std::free(snaps);
    return ids;
}
