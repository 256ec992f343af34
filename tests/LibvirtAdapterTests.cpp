#include <gtest/gtest.h>
#include <pugixml.hpp>
#include <libvirt/libvirt.h>
#include <memory>
#include <string>

#include "Virtualization/snapshot/SnapshotManager.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/vmm/VirtualMachineFactory.hpp"
#include "support/TestLogging.hpp"

TEST(VirtualMachine, LibvirtStateMapping) {
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_NOSTATE), VmState::Unknown);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_RUNNING), VmState::Running);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_BLOCKED), VmState::Running);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_PAUSED), VmState::Paused);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_PMSUSPENDED), VmState::Paused);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_SHUTDOWN), VmState::ShuttingDown);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_SHUTOFF), VmState::Stopped);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(VIR_DOMAIN_CRASHED), VmState::Crashed);
    EXPECT_EQ(VirtualMachine::mapLibvirtState(999), VmState::Unknown);
}

TEST(SnapshotManager, SnapshotXmlEscapesText) {
    const std::string xml = SnapshotManager::buildSnapshotXML("golden", "clean <state> & ready");

    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(xml.c_str()));
    EXPECT_STREQ(doc.child("domainsnapshot").child("name").text().get(), "golden");
    EXPECT_STREQ(doc.child("domainsnapshot").child("description").text().get(), "clean <state> & ready");
}

TEST(HypervisorConnector, StartsDisconnected) {
    HypervisorConnector connector("test:///default");
    EXPECT_FALSE(connector.isConnected());
    EXPECT_FALSE(connector.isAlive());
    EXPECT_EQ(connector.getRawHandle(), nullptr);
    EXPECT_EQ(connector.uri(), "test:///default");
}

TEST(VirtualMachineFactory, InvalidTemplateRejected) {
    auto connector = std::make_shared<HypervisorConnector>("test:///default");
    VirtualMachineFactory factory(connector);
    MachineTemplate tmpl;
    tmpl.name = "bad";
    tmpl.vcpus = 0;
    EXPECT_TRUE(factory.buildDomainXML(tmpl).isErr());
    EXPECT_THROW((void)factory.createMachine(tmpl), LibvirtException);
}
