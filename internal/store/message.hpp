#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet::store {

// A message is a Struct with a string "type" field.
using Message = google::protobuf::Struct;

Message MakeMessage(std::string_view type);

// Empty when the field is missing or not a string.
std::string MessageType(const Message& message);

void SetString(Message& message, std::string_view key, std::string_view value);
void SetInt(Message& message, std::string_view key, std::int64_t value);
void SetBool(Message& message, std::string_view key, bool value);
void SetStringList(Message& message, std::string_view key, const std::vector<std::string>& values);

std::optional<std::string>  GetString(const Message& message, std::string_view key);
std::optional<std::int64_t> GetInt(const Message& message, std::string_view key);
std::optional<bool>         GetBool(const Message& message, std::string_view key);

// Throws std::runtime_error on invalid input.
std::string ToJson(const Message& message);
Message     FromJson(const std::string& json);

} // namespace fleet::store
