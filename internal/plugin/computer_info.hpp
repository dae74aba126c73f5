#pragma once

#include <filesystem>
#include <functional>
#include <string>

#include "internal/plugin/data_watcher.hpp"

namespace fleet::plugin {

// "computer-info": host name and virtualization type.
class ComputerInfo final : public DataWatcher {
 public:
  using HostnameSource = std::function<std::string()>;

  explicit ComputerInfo(HostnameSource hostname = {});

  std::string Name() const override {
    return "ComputerInfo";
  }

 protected:
  std::optional<store::Message> Collect() override;

 private:
  HostnameSource hostname_;
};

} // namespace fleet::plugin
