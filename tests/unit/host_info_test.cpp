#include "internal/util/host_info.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

using fleet::util::DetectVmInfo;

std::filesystem::path FreshRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "fleet_agent_host_info_tests" / test_name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root;
}

void Touch(const std::filesystem::path& path, const std::string& contents = {}) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path);
  out << contents;
}

void TestBareMetal() {
  const auto root = FreshRoot("bare");
  Touch(root / "proc/cpuinfo", "model name\t: Intel(R) Xeon(R) CPU\n");
  assert(DetectVmInfo(root).empty());
}

void TestOpenVz() {
  const auto root = FreshRoot("openvz");
  std::filesystem::create_directories(root / "proc/vz");
  assert(DetectVmInfo(root) == "openvz");
}

void TestXenMarkers() {
  for (const char* marker : {"proc/sys/xen", "sys/bus/xen", "proc/xen"}) {
    const auto root = FreshRoot("xen");
    std::filesystem::create_directories(root / marker);
    assert(DetectVmInfo(root) == "xen");
  }
}

void TestQemuCpuWins() {
  const auto root = FreshRoot("kvm");
  std::filesystem::create_directories(root / "proc/xen");
  Touch(root / "proc/cpuinfo", "processor\t: 0\nmodel name\t: QEMU Virtual CPU version 2.5+\n");
  assert(DetectVmInfo(root) == "kvm");
}

void TestHostname() {
  assert(!fleet::util::Hostname().empty());
}

} // namespace

int main() {
  TestBareMetal();
  TestOpenVz();
  TestXenMarkers();
  TestQemuCpuWins();
  TestHostname();

  std::cout << "fleet_agent_unit_host_info: pass\n";
  return 0;
}
