#include "Virtualization/vmm/VirtualMachineFactory.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/builder/VirtualMachineBuilder.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"

VirtualMachineFactory::VirtualMachineFactory(std::shared_ptr<HypervisorConnector> conn)
    : connector(std::move(conn)) {
    if (!connector) throw VmException("VirtualMachineFactory requires a connector");
}

VirtualMachineFactory::~VirtualMachineFactory() = default;

std::unique_ptr<IMachineHandle> VirtualMachineFactory::createMachine(const MachineTemplate& tmpl) {
    const std::string xml = buildDomainXML(tmpl).expect<LibvirtException>("build domain XML for " + tmpl.name);
    virDomainPtr dom = defineDomain(xml).expect<LibvirtException>("define domain " + tmpl.name);
    AH_LOG_DEBUG("Defined domain {} ({} vCPU, {} MiB, network {})",
                 tmpl.name, tmpl.vcpus, tmpl.memoryMiB, toString(tmpl.network));
    return std::make_unique<VirtualMachine>(connector, dom);
}

Result<std::string> VirtualMachineFactory::buildDomainXML(const MachineTemplate& tmpl) const {
    if (!tmpl.validate()) return Result<std::string>::Err("invalid machine template for '" + tmpl.name + "'");
    try {
        VirtualMachineBuilder builder;
        return Result<std::string>::Ok(builder.fromTemplate(tmpl).build());
    } catch (const VmException& e) {
        return Result<std::string>::Err(e.what());
    }
}

Result<virDomainPtr> VirtualMachineFactory::defineDomain(const std::string& xml) {
    virConnectPtr c = connector->getRawHandle();
    if (!c) return Result<virDomainPtr>::Err("not connected to " + connector->uri());
    virDomainPtr dom = virDomainDefineXML(c, xml.c_str());
    if (!dom) {
        return Result<virDomainPtr>::Err("virDomainDefineXML failed: " + lastLibvirtError());
    }
    return Result<virDomainPtr>::Ok(dom);
}
