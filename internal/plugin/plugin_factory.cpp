#include "plugin_factory.hpp"

#include <algorithm>

#include "internal/plugin/computer_info.hpp"
#include "internal/plugin/reboot_required.hpp"
#include "internal/util/errors.hpp"

namespace fleet::plugin {

namespace {

std::unique_ptr<Plugin> Create(const std::string& name) {
  if (name == "ComputerInfo") return std::make_unique<ComputerInfo>();
  if (name == "RebootRequired") return std::make_unique<RebootRequired>();
  throw util::ConfigError("unknown monitor plugin: " + name);
}

} // namespace

std::vector<std::string> BuiltinPluginNames() {
  return {"ComputerInfo", "RebootRequired"};
}

std::vector<std::unique_ptr<Plugin>> CreatePlugins(const std::vector<std::string>& names) {
  std::vector<std::string> selected;
  for (const auto& name : names) {
    if (name == "ALL") {
      for (const auto& builtin : BuiltinPluginNames()) selected.push_back(builtin);
      continue;
    }
    selected.push_back(name);
  }

  std::vector<std::unique_ptr<Plugin>> plugins;
  std::vector<std::string>             seen;
  for (const auto& name : selected) {
    if (std::find(seen.begin(), seen.end(), name) != seen.end()) continue;
    seen.push_back(name);
    plugins.push_back(Create(name));
  }
  return plugins;
}

} // namespace fleet::plugin
