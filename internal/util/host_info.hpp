#pragma once

#include <filesystem>
#include <string>

namespace fleet::util {

// Virtualization technology seen under `root`: "openvz", "xen", "kvm" or
// empty when none is detected.
std::string DetectVmInfo(const std::filesystem::path& root = "/");

// Local host name; empty if it cannot be read.
std::string Hostname();

} // namespace fleet::util
