#include "reboot_required.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <system_error>

namespace fleet::plugin {

RebootRequired::RebootRequired() : DataWatcher("reboot-required-info") {}

std::optional<store::Message> RebootRequired::Collect() {
  std::filesystem::path root = "/";
  if (context_ && context_->config && !context_->config->monitor().root_path().empty()) {
    root = context_->config->monitor().root_path();
  }

  std::error_code ec;
  const bool      flag = std::filesystem::exists(root / "var/run/reboot-required", ec);

  // sorted, without duplicates or blank lines
  std::set<std::string> packages;
  std::ifstream         in(root / "var/run/reboot-required.pkgs");
  for (std::string line; std::getline(in, line);) {
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) line.pop_back();
    if (!line.empty()) packages.insert(line);
  }

  auto message = store::MakeMessage(MessageType());
  store::SetBool(message, "flag", flag);
  store::SetStringList(message, "packages", {packages.begin(), packages.end()});
  return message;
}

} // namespace fleet::plugin
