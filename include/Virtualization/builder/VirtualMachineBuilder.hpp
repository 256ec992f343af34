#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"
#include <string>
#include <string_view>

/**
 * @brief Builds the libvirt domain XML for an agent machine.
 *
 * KVM guest with host-passthrough CPU, cgroup limits (cputune/memtune),
 * a virtio qcow2 disk, a virtio NIC on the `agent-<mode>` network, a pty
 * serial console and a virtio vsock device with an auto-assigned CID.
 */
class VirtualMachineBuilder : public IXmlBuilderBase {
private:
  std::string name;
  unsigned long memoryMiB{ 2048 };
  unsigned int vcpuCount{ 2 };
  std::string diskPath;
  std::string osType{ "hvm" };
  std::string architecture{ "x86_64" };
  NetworkMode network{ NetworkMode::NatFiltered };
  bool vsock{ true };

  void buildDocument() override;

  void buildOsSection();
  void buildMemorySection();
  void buildCpuSection();
  void buildTuningSection();
  void buildDevicesSection();
  void buildDiskDevice(pugi::xml_node devices);
  void buildNetworkDevice(pugi::xml_node devices);
  void buildConsoleDevices(pugi::xml_node devices);
  void buildVsockDevice(pugi::xml_node devices);

public:
  static constexpr const char* kNetworkFilter = "agent-network-filter";

  VirtualMachineBuilder() = default;
  ~VirtualMachineBuilder() override = default;

  // Copies every field of the template; an empty diskPath resolves to the default image path.
  VirtualMachineBuilder& fromTemplate(const MachineTemplate& tmpl);

  VirtualMachineBuilder& setName(std::string_view name);
  VirtualMachineBuilder& setMemoryMiB(unsigned long memory);
  VirtualMachineBuilder& setCpuCount(unsigned int vcpus);
  VirtualMachineBuilder& setDisk(std::string_view diskPath);
  VirtualMachineBuilder& setOsType(std::string_view osType = "hvm");
  VirtualMachineBuilder& setArchitecture(std::string_view arch = "x86_64");
  VirtualMachineBuilder& setNetworkMode(NetworkMode mode);
  VirtualMachineBuilder& enableVsock(bool enabled);

  // Network the NIC attaches to, e.g. "agent-nat-filtered".
  [[nodiscard]] static std::string networkName(NetworkMode mode);
};
