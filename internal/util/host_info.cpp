#include "host_info.hpp"

#include <unistd.h>

#include <climits>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fleet::util {

namespace {

bool Exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

} // namespace

std::string DetectVmInfo(const std::filesystem::path& root) {
  std::string vm;

  if (Exists(root / "proc/vz")) {
    vm = "openvz";
  } else if (Exists(root / "proc/sys/xen") || Exists(root / "sys/bus/xen") || Exists(root / "proc/xen")) {
    vm = "xen";
  }

  // a QEMU CPU wins over the container checks above
  std::ifstream cpuinfo(root / "proc/cpuinfo");
  if (cpuinfo) {
    const std::string contents((std::istreambuf_iterator<char>(cpuinfo)), std::istreambuf_iterator<char>());
    if (contents.find("QEMU Virtual CPU") != std::string::npos) vm = "kvm";
  }

  return vm;
}

std::string Hostname() {
  char buf[HOST_NAME_MAX + 1] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) return {};
  return buf;
}

} // namespace fleet::util
