#include "computer_info.hpp"

#include "internal/util/host_info.hpp"

namespace fleet::plugin {

ComputerInfo::ComputerInfo(HostnameSource hostname) : DataWatcher("computer-info"), hostname_(std::move(hostname)) {
  if (!hostname_) hostname_ = [] { return util::Hostname(); };
}

std::optional<store::Message> ComputerInfo::Collect() {
  std::filesystem::path root = "/";
  if (context_ && context_->config && !context_->config->monitor().root_path().empty()) {
    root = context_->config->monitor().root_path();
  }

  auto message = store::MakeMessage(MessageType());
  store::SetString(message, "hostname", hostname_());
  store::SetString(message, "vm-info", util::DetectVmInfo(root));
  return message;
}

} // namespace fleet::plugin
