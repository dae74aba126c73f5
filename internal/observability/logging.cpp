#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace fleet::observability {
namespace {

constexpr const char* kLoggerName = "fleet-agent";

std::string ResolveLevel(const fleet::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("FLEET_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const fleet::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("FLEET_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

spdlog::level::level_enum ParseLevel(std::string_view name) {
  if (name == "warning") return spdlog::level::warn;

  const auto level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw util::ConfigError("unknown log level: " + std::string(name));
  }
  return level;
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const fleet::runtime::config::RuntimeConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;

  if (!config.logging().quiet()) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }

  if (!config.logging().log_dir().empty()) {
    std::filesystem::create_directories(config.logging().log_dir());
    const auto log_file = std::filesystem::path(config.logging().log_dir()) / (std::string(kLoggerName) + ".log");
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string()));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ParseLevel(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace fleet::observability
