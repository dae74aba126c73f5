#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"

namespace fleet::config {

/*
  Values given on the command line. Each set field overrides the file.
*/
struct CommandLineOptions {
  std::string                config_path;
  std::optional<std::string> url;
  std::optional<std::string> computer_title;
  std::optional<std::string> account_name;
  std::optional<std::string> data_path;
  std::optional<std::string> log_level;
  bool                       quiet = false;
  bool                       help  = false;
};

// Throws ConfigError on unknown flags or missing values.
CommandLineOptions ParseCommandLine(int argc, const char* const* argv);

std::string Usage();

/*
  Loads RuntimeConfig.

  YAML is converted to JSON then parsed into protobuf. Precedence, lowest
  first: compiled defaults, YAML file, command line. Defaults only fill
  fields left empty by the other two.
*/
class ConfigLoader {
 public:
  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static fleet::runtime::config::RuntimeConfig Load(const CommandLineOptions& options);

  static void ApplyCommandLine(const CommandLineOptions& options, fleet::runtime::config::RuntimeConfig* config);
  static void ApplyDefaults(fleet::runtime::config::RuntimeConfig* config);
  static void Validate(const fleet::runtime::config::RuntimeConfig& config);
};

} // namespace fleet::config
