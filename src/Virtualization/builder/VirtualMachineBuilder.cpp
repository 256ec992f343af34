#include "Virtualization/builder/VirtualMachineBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <pugixml.hpp>

void VirtualMachineBuilder::buildDocument() {
  if (name.empty()) {
    throw VmException("domain name is required");
  }
  if (diskPath.empty()) {
    throw VmException("disk path is required for " + name);
  }

  auto root = doc.append_child("domain");
  root.append_attribute("type") = "kvm";
  root.append_child("name").text() = name.c_str();

  buildMemorySection();
  buildCpuSection();
  buildOsSection();
  buildTuningSection();
  buildDevicesSection();
}

void VirtualMachineBuilder::buildOsSection() {
  auto domain = doc.child("domain");
  auto os = domain.append_child("os");
  auto type = os.append_child("type");
  type.append_attribute("arch") = architecture.c_str();
  type.text() = osType.c_str();
  os.append_child("boot").append_attribute("dev") = "hd";

  domain.append_child("cpu").append_attribute("mode") = "host-passthrough";

  auto features = domain.append_child("features");
  features.append_child("acpi");
  features.append_child("apic");
}

void VirtualMachineBuilder::buildMemorySection() {
  auto memory = doc.child("domain").append_child("memory");
  memory.append_attribute("unit") = "MiB";
  memory.text() = memoryMiB;
}

void VirtualMachineBuilder::buildCpuSection() {
  auto vcpu = doc.child("domain").append_child("vcpu");
  vcpu.text() = vcpuCount;
}

// cgroup limits: one full host CPU per vCPU, memory capped at the allocation.
void VirtualMachineBuilder::buildTuningSection() {
  auto domain = doc.child("domain");

  auto cputune = domain.append_child("cputune");
  cputune.append_child("shares").text() = 1024;
  cputune.append_child("period").text() = 100000;
  cputune.append_child("quota").text() = static_cast<long long>(vcpuCount) * 100000;

  auto memtune = domain.append_child("memtune");
  auto hardLimit = memtune.append_child("hard_limit");
  hardLimit.append_attribute("unit") = "MiB";
  hardLimit.text() = memoryMiB;
}

void VirtualMachineBuilder::buildDevicesSection() {
  auto devices = doc.child("domain").append_child("devices");
  buildDiskDevice(devices);
  buildNetworkDevice(devices);
  buildConsoleDevices(devices);
  if (vsock) {
    buildVsockDevice(devices);
  }
}

void VirtualMachineBuilder::buildDiskDevice(pugi::xml_node devices) {
  auto disk = devices.append_child("disk");
  disk.append_attribute("type") = "file";
  disk.append_attribute("device") = "disk";

  auto driver = disk.append_child("driver");
  driver.append_attribute("name") = "qemu";
  driver.append_attribute("type") = "qcow2";
  driver.append_attribute("cache") = "writeback";

  disk.append_child("source").append_attribute("file") = diskPath.c_str();

  auto target = disk.append_child("target");
  target.append_attribute("dev") = "vda";
  target.append_attribute("bus") = "virtio";
}

void VirtualMachineBuilder::buildNetworkDevice(pugi::xml_node devices) {
  auto iface = devices.append_child("interface");
  iface.append_attribute("type") = "network";
  iface.append_child("source").append_attribute("network") = networkName(network).c_str();
  iface.append_child("model").append_attribute("type") = "virtio";

  if (network != NetworkMode::Bridge) {
    iface.append_child("filterref").append_attribute("filter") = kNetworkFilter;
  }
}

void VirtualMachineBuilder::buildConsoleDevices(pugi::xml_node devices) {
  auto serial = devices.append_child("serial");
  serial.append_attribute("type") = "pty";
  serial.append_child("target").append_attribute("port") = 0;

  auto console = devices.append_child("console");
  console.append_attribute("type") = "pty";
  auto target = console.append_child("target");
  target.append_attribute("type") = "serial";
  target.append_attribute("port") = 0;
}

void VirtualMachineBuilder::buildVsockDevice(pugi::xml_node devices) {
  auto vsockNode = devices.append_child("vsock");
  vsockNode.append_attribute("model") = "virtio";
  vsockNode.append_child("cid").append_attribute("auto") = "yes";
}

std::string VirtualMachineBuilder::networkName(NetworkMode mode) {
  return "agent-" + std::string(toString(mode));
}

VirtualMachineBuilder& VirtualMachineBuilder::fromTemplate(const MachineTemplate& tmpl) {
  name = tmpl.name;
  memoryMiB = tmpl.memoryMiB;
  vcpuCount = tmpl.vcpus;
  diskPath = tmpl.resolvedDiskPath();
  osType = tmpl.osType;
  architecture = tmpl.arch;
  network = tmpl.network;
  vsock = tmpl.enableVsock;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setName(std::string_view name) {
  this->name = name;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setMemoryMiB(unsigned long memory) {
  this->memoryMiB = memory;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setCpuCount(unsigned int vcpus) {
  this->vcpuCount = vcpus;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setDisk(std::string_view diskPath) {
  this->diskPath = diskPath;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setOsType(std::string_view osType) {
  this->osType = osType;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setArchitecture(std::string_view arch) {
  this->architecture = arch;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setNetworkMode(NetworkMode mode) {
  this->network = mode;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::enableVsock(bool enabled) {
  this->vsock = enabled;
  return *this;
}
