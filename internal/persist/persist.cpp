#include "persist.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "fleet/persist/v1/persist.pb.h"
#include "internal/observability/logging.hpp"

namespace fleet::persist {

using fleet::observability::IntField;
using fleet::observability::StringField;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> parts;
  std::string              current;
  for (char c : path) {
    if (c == '.') {
      if (!current.empty()) parts.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) parts.push_back(std::move(current));
  return parts;
}

const Value* Find(const Struct& root, std::string_view path) {
  const auto parts = SplitPath(path);
  if (parts.empty()) return nullptr;

  const Struct* node = &root;
  for (size_t i = 0; i < parts.size(); ++i) {
    auto it = node->fields().find(parts[i]);
    if (it == node->fields().end()) return nullptr;
    if (i + 1 == parts.size()) return &it->second;
    if (!it->second.has_struct_value()) return nullptr;
    node = &it->second.struct_value();
  }
  return nullptr;
}

bool RemoveFrom(Struct* node, const std::vector<std::string>& parts, size_t depth) {
  auto* fields = node->mutable_fields();
  auto  it     = fields->find(parts[depth]);
  if (it == fields->end()) return false;

  if (depth + 1 == parts.size()) {
    fields->erase(it);
    return true;
  }

  if (!it->second.has_struct_value()) return false;
  const bool removed = RemoveFrom(it->second.mutable_struct_value(), parts, depth + 1);
  if (removed && it->second.struct_value().fields().empty()) {
    fields->erase(it);
  }
  return removed;
}

std::filesystem::path WithSuffix(const std::filesystem::path& path, const char* suffix) {
  return std::filesystem::path(path.string() + suffix);
}

} // namespace

const char* LoadStatusName(LoadStatus status) {
  switch (status) {
    case LoadStatus::kFresh:
      return "fresh";
    case LoadStatus::kLoaded:
      return "loaded";
    case LoadStatus::kRecoveredFromBackup:
      return "recovered-from-backup";
    case LoadStatus::kReset:
      return "reset";
  }
  return "unknown";
}

Persist::Persist(std::filesystem::path path) : path_(std::move(path)) {
}

// ------------------------------------------------------------
// Load / Save
// ------------------------------------------------------------

bool Persist::ReadSnapshot(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) return false;

  const std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  fleet::persist::v1::PersistSnapshot snapshot;
  auto status = google::protobuf::util::JsonStringToMessage(json, &snapshot);
  if (!status.ok()) {
    FLEET_LOG_WARN("Persisted state is unreadable", {StringField("path", file.string()), StringField("error", std::string(status.message()))});
    return false;
  }

  if (snapshot.version() > kVersion) {
    FLEET_LOG_WARN("Persisted state was written by a newer version", {StringField("path", file.string()), IntField("version", snapshot.version())});
    return false;
  }

  data_     = snapshot.data();
  modified_ = false;
  return true;
}

LoadStatus Persist::Load() {
  data_.Clear();
  modified_ = false;

  if (path_.empty()) return LoadStatus::kFresh;

  const auto backup = WithSuffix(path_, ".old");
  const bool has_primary = std::filesystem::exists(path_);
  const bool has_backup  = std::filesystem::exists(backup);

  if (!has_primary && !has_backup) return LoadStatus::kFresh;

  if (has_primary && ReadSnapshot(path_)) return LoadStatus::kLoaded;

  if (has_backup && ReadSnapshot(backup)) {
    FLEET_LOG_WARN("Recovered persisted state from backup", {StringField("path", backup.string())});
    modified_ = true;
    return LoadStatus::kRecoveredFromBackup;
  }

  data_.Clear();
  modified_ = true;
  FLEET_LOG_WARN("Persisted state discarded, starting fresh", {StringField("path", path_.string())});
  return LoadStatus::kReset;
}

void Persist::Save() {
  if (path_.empty()) {
    modified_ = false;
    return;
  }

  fleet::persist::v1::PersistSnapshot snapshot;
  snapshot.set_version(kVersion);
  *snapshot.mutable_data() = data_;

  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize persisted state: " + std::string(status.message()));
  }

  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }

  const auto tmp_path = WithSuffix(path_, ".new");
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    out << json;
    out.flush();
    if (!out) {
      throw std::runtime_error("Failed to write persisted state: " + tmp_path.string());
    }
  }

  if (std::filesystem::exists(path_)) {
    std::filesystem::rename(path_, WithSuffix(path_, ".old"));
  }
  std::filesystem::rename(tmp_path, path_);
  modified_ = false;
}

// ------------------------------------------------------------
// Accessors
// ------------------------------------------------------------

bool Persist::Has(std::string_view path) const {
  return Find(data_, path) != nullptr;
}

std::optional<Value> Persist::Get(std::string_view path) const {
  const auto* value = Find(data_, path);
  if (!value) return std::nullopt;
  return *value;
}

std::int64_t Persist::GetInt(std::string_view path, std::int64_t fallback) const {
  const auto* value = Find(data_, path);
  if (!value || !value->has_number_value()) return fallback;
  return static_cast<std::int64_t>(value->number_value());
}

std::string Persist::GetString(std::string_view path, std::string_view fallback) const {
  const auto* value = Find(data_, path);
  if (!value || !value->has_string_value()) return std::string(fallback);
  return value->string_value();
}

bool Persist::GetBool(std::string_view path, bool fallback) const {
  const auto* value = Find(data_, path);
  if (!value || !value->has_bool_value()) return fallback;
  return value->bool_value();
}

std::vector<std::string> Persist::GetStringList(std::string_view path) const {
  std::vector<std::string> out;
  const auto*              value = Find(data_, path);
  if (!value || !value->has_list_value()) return out;
  for (const auto& item : value->list_value().values()) {
    if (item.has_string_value()) out.push_back(item.string_value());
  }
  return out;
}

void Persist::Set(std::string_view path, const Value& value) {
  const auto parts = SplitPath(path);
  if (parts.empty()) {
    throw std::invalid_argument("empty persist path");
  }

  Struct* node = &data_;
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    auto& child = (*node->mutable_fields())[parts[i]];
    if (!child.has_struct_value()) {
      child.mutable_struct_value();
    }
    node = child.mutable_struct_value();
  }

  (*node->mutable_fields())[parts.back()] = value;
  modified_ = true;
}

void Persist::SetInt(std::string_view path, std::int64_t value) {
  Value v;
  v.set_number_value(static_cast<double>(value));
  Set(path, v);
}

void Persist::SetString(std::string_view path, std::string_view value) {
  Value v;
  v.set_string_value(std::string(value));
  Set(path, v);
}

void Persist::SetBool(std::string_view path, bool value) {
  Value v;
  v.set_bool_value(value);
  Set(path, v);
}

void Persist::SetStringList(std::string_view path, const std::vector<std::string>& values) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& item : values) {
    list->add_values()->set_string_value(item);
  }
  Set(path, v);
}

bool Persist::Remove(std::string_view path) {
  const auto parts = SplitPath(path);
  if (parts.empty()) return false;
  const bool removed = RemoveFrom(&data_, parts, 0);
  if (removed) modified_ = true;
  return removed;
}

void Persist::Clear() {
  data_.Clear();
  modified_ = true;
}

PersistView Persist::RootAt(std::string prefix) {
  return PersistView(this, std::move(prefix));
}

// ------------------------------------------------------------
// PersistView
// ------------------------------------------------------------

PersistView::PersistView(Persist* persist, std::string prefix) : persist_(persist), prefix_(std::move(prefix)) {
}

std::string PersistView::Full(std::string_view path) const {
  if (prefix_.empty()) return std::string(path);
  return prefix_ + "." + std::string(path);
}

bool PersistView::Has(std::string_view path) const {
  return persist_->Has(Full(path));
}

std::optional<Value> PersistView::Get(std::string_view path) const {
  return persist_->Get(Full(path));
}

std::int64_t PersistView::GetInt(std::string_view path, std::int64_t fallback) const {
  return persist_->GetInt(Full(path), fallback);
}

std::string PersistView::GetString(std::string_view path, std::string_view fallback) const {
  return persist_->GetString(Full(path), fallback);
}

bool PersistView::GetBool(std::string_view path, bool fallback) const {
  return persist_->GetBool(Full(path), fallback);
}

std::vector<std::string> PersistView::GetStringList(std::string_view path) const {
  return persist_->GetStringList(Full(path));
}

void PersistView::Set(std::string_view path, const Value& value) {
  persist_->Set(Full(path), value);
}

void PersistView::SetInt(std::string_view path, std::int64_t value) {
  persist_->SetInt(Full(path), value);
}

void PersistView::SetString(std::string_view path, std::string_view value) {
  persist_->SetString(Full(path), value);
}

void PersistView::SetBool(std::string_view path, bool value) {
  persist_->SetBool(Full(path), value);
}

void PersistView::SetStringList(std::string_view path, const std::vector<std::string>& values) {
  persist_->SetStringList(Full(path), values);
}

bool PersistView::Remove(std::string_view path) {
  return persist_->Remove(Full(path));
}

void PersistView::Clear() {
  if (prefix_.empty()) {
    persist_->Clear();
    return;
  }
  persist_->Remove(prefix_);
}

void PersistView::Save() {
  persist_->Save();
}

PersistView PersistView::RootAt(std::string_view sub) {
  return PersistView(persist_, Full(sub));
}

} // namespace fleet::persist
