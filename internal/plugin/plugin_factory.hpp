#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/plugin/plugin.hpp"

namespace fleet::plugin {

// Names accepted in monitor.plugins, in the order "ALL" creates them.
std::vector<std::string> BuiltinPluginNames();

// "ALL" expands to every built-in plugin. Throws util::ConfigError on an
// unknown name.
std::vector<std::unique_ptr<Plugin>> CreatePlugins(const std::vector<std::string>& names);

} // namespace fleet::plugin
