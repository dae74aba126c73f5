#pragma once

#include "internal/plugin/data_watcher.hpp"

namespace fleet::plugin {

/*
  "reboot-required-info": whether <root>/var/run/reboot-required exists and
  the packages listed in <root>/var/run/reboot-required.pkgs.
*/
class RebootRequired final : public DataWatcher {
 public:
  RebootRequired();

  std::string Name() const override {
    return "RebootRequired";
  }

 protected:
  std::optional<store::Message> Collect() override;
};

} // namespace fleet::plugin
