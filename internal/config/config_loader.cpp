#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::config {

using fleet::runtime::config::RuntimeConfig;
using fleet::util::ConfigError;

namespace {

constexpr const char* kDefaultDataPath = "/var/lib/fleet-agent";

void SetDurationIfUnset(google::protobuf::Duration* field, std::chrono::seconds value) {
  if (field->seconds() == 0 && field->nanos() == 0) {
    *field = fleet::util::ToProto(value);
  }
}

void RequirePositive(const google::protobuf::Duration& d, const std::string& name) {
  if (d.seconds() < 0 || (d.seconds() == 0 && d.nanos() <= 0)) {
    throw ConfigError("configuration value must be a positive duration: " + name);
  }
}

std::string TakeValue(int argc, const char* const* argv, int& i) {
  const std::string flag = argv[i];
  if (i + 1 >= argc) {
    throw ConfigError("missing value for " + flag);
  }
  return argv[++i];
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("900s", "1.0")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig ConfigLoader::Load(const CommandLineOptions& options) {
  RuntimeConfig config;
  if (!options.config_path.empty()) {
    config = LoadFromYaml(options.config_path);
  }

  ApplyCommandLine(options, &config);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyCommandLine(const CommandLineOptions& options, RuntimeConfig* config) {
  if (options.url) config->mutable_transport()->set_endpoint(*options.url);
  if (options.computer_title) config->mutable_client()->set_computer_title(*options.computer_title);
  if (options.account_name) config->mutable_client()->set_account_name(*options.account_name);
  if (options.data_path) config->mutable_client()->set_data_path(*options.data_path);
  if (options.log_level) config->mutable_logging()->set_level(*options.log_level);
  if (options.quiet) config->mutable_logging()->set_quiet(true);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  using std::chrono::seconds;

  auto* client = config->mutable_client();
  if (client->data_path().empty()) client->set_data_path(kDefaultDataPath);
  const std::filesystem::path data_path(client->data_path());

  if (client->url().empty()) client->set_url(config->transport().endpoint());

  auto* exchange = config->mutable_exchange();
  SetDurationIfUnset(exchange->mutable_exchange_interval(), seconds(900));
  SetDurationIfUnset(exchange->mutable_urgent_exchange_interval(), seconds(60));
  SetDurationIfUnset(exchange->mutable_minimum_exchange_spacing(), seconds(10));
  SetDurationIfUnset(exchange->mutable_max_backoff(), seconds(3600));
  SetDurationIfUnset(exchange->mutable_exchange_timeout(), seconds(120));
  if (exchange->max_messages_per_exchange() == 0) exchange->set_max_messages_per_exchange(100);
  if (!exchange->has_heartbeat()) exchange->set_heartbeat(true);
  if (exchange->urgent_message_types().empty()) exchange->add_urgent_message_types("operation-result");

  auto* store = config->mutable_message_store();
  if (store->backend_case() == fleet::runtime::config::MessageStoreConfig::BACKEND_NOT_SET) {
    store->mutable_sqlite()->set_path((data_path / "messages.db").string());
  } else if (store->has_sqlite() && store->sqlite().path().empty()) {
    store->mutable_sqlite()->set_path((data_path / "messages.db").string());
  }

  auto* persist = config->mutable_persist();
  if (persist->path().empty()) persist->set_path((data_path / "agent.json").string());
  SetDurationIfUnset(persist->mutable_checkpoint_interval(), seconds(300));

  auto* transport = config->mutable_transport();
  SetDurationIfUnset(transport->mutable_deadline(), seconds(60));

  auto* monitor = config->mutable_monitor();
  SetDurationIfUnset(monitor->mutable_run_interval(), seconds(60));
  if (monitor->plugins().empty()) monitor->add_plugins("ALL");
  if (monitor->root_path().empty()) monitor->set_root_path("/");

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.client().account_name().empty()) {
    throw ConfigError("must specify --account-name or client.account_name in the config file");
  }
  if (config.transport().endpoint().empty()) {
    throw ConfigError("must specify --url or transport.endpoint in the config file");
  }

  observability::ParseLevel(config.logging().level());

  const auto& exchange = config.exchange();
  RequirePositive(exchange.exchange_interval(), "exchange.exchange_interval");
  RequirePositive(exchange.urgent_exchange_interval(), "exchange.urgent_exchange_interval");
  RequirePositive(exchange.max_backoff(), "exchange.max_backoff");
  RequirePositive(exchange.exchange_timeout(), "exchange.exchange_timeout");
  RequirePositive(config.monitor().run_interval(), "monitor.run_interval");
  RequirePositive(config.persist().checkpoint_interval(), "persist.checkpoint_interval");
}

// ------------------------------------------------------------
// Command line
// ------------------------------------------------------------

std::string Usage() {
  std::ostringstream out;
  out << "Usage: fleet-agent [options]\n"
      << "  -c, --config FILE         YAML configuration file\n"
      << "      --url ENDPOINT        Exchange server endpoint (host:port)\n"
      << "      --computer-title NAME Title shown for this computer\n"
      << "      --account-name NAME   Account to register with\n"
      << "  -d, --data-path PATH      Directory for persisted state\n"
      << "      --log-level LEVEL     trace, debug, info, warning, error\n"
      << "  -q, --quiet               Do not log to standard output\n"
      << "  -h, --help                Show this message\n";
  return out.str();
}

CommandLineOptions ParseCommandLine(int argc, const char* const* argv) {
  CommandLineOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      options.config_path = TakeValue(argc, argv, i);
    } else if (arg == "--url") {
      options.url = TakeValue(argc, argv, i);
    } else if (arg == "--computer-title") {
      options.computer_title = TakeValue(argc, argv, i);
    } else if (arg == "--account-name") {
      options.account_name = TakeValue(argc, argv, i);
    } else if (arg == "-d" || arg == "--data-path") {
      options.data_path = TakeValue(argc, argv, i);
    } else if (arg == "--log-level") {
      options.log_level = TakeValue(argc, argv, i);
    } else if (arg == "-q" || arg == "--quiet") {
      options.quiet = true;
    } else if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else {
      throw ConfigError("unknown option: " + arg);
    }
  }

  return options;
}

} // namespace fleet::config
