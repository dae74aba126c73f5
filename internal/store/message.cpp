#include "message.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>

namespace fleet::store {

using google::protobuf::Value;

Message MakeMessage(std::string_view type) {
  Message m;
  SetString(m, "type", type);
  return m;
}

std::string MessageType(const Message& message) {
  auto v = GetString(message, "type");
  return v ? *v : std::string{};
}

void SetString(Message& message, std::string_view key, std::string_view value) {
  (*message.mutable_fields())[std::string(key)].set_string_value(std::string(value));
}

void SetInt(Message& message, std::string_view key, std::int64_t value) {
  // Struct numbers are doubles; exact up to 2^53
  (*message.mutable_fields())[std::string(key)].set_number_value(static_cast<double>(value));
}

void SetBool(Message& message, std::string_view key, bool value) {
  (*message.mutable_fields())[std::string(key)].set_bool_value(value);
}

void SetStringList(Message& message, std::string_view key, const std::vector<std::string>& values) {
  auto* list = (*message.mutable_fields())[std::string(key)].mutable_list_value();
  list->clear_values();
  for (const auto& v : values) list->add_values()->set_string_value(v);
}

std::optional<std::string> GetString(const Message& message, std::string_view key) {
  auto it = message.fields().find(std::string(key));
  if (it == message.fields().end() || it->second.kind_case() != Value::kStringValue) return std::nullopt;
  return it->second.string_value();
}

std::optional<std::int64_t> GetInt(const Message& message, std::string_view key) {
  auto it = message.fields().find(std::string(key));
  if (it == message.fields().end() || it->second.kind_case() != Value::kNumberValue) return std::nullopt;
  const double d = it->second.number_value();
  if (!std::isfinite(d) || std::trunc(d) != d) return std::nullopt;
  return static_cast<std::int64_t>(d);
}

std::optional<bool> GetBool(const Message& message, std::string_view key) {
  auto it = message.fields().find(std::string(key));
  if (it == message.fields().end() || it->second.kind_case() != Value::kBoolValue) return std::nullopt;
  return it->second.bool_value();
}

std::string ToJson(const Message& message) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out);
  if (!status.ok()) throw std::runtime_error("message encode failed: " + status.ToString());
  return out;
}

Message FromJson(const std::string& json) {
  Message m;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &m);
  if (!status.ok()) throw std::runtime_error("message decode failed: " + status.ToString());
  return m;
}

} // namespace fleet::store
