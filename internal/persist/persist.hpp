#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet::persist {

enum class LoadStatus {
  kFresh,                // no file on disk
  kLoaded,
  kRecoveredFromBackup,  // primary unreadable, backup used
  kReset,                // nothing readable, started empty
};

const char* LoadStatusName(LoadStatus status);

class PersistView;

/*
  Versioned nested mapping addressed by dotted paths
  ("registration.secure-id", "message-store.next-sequence").

  Snapshot layout on disk (JSON):
      { "version": 1, "data": { ... } }

  Save is atomic:
      write <path>.new → keep previous as <path>.old → rename

  Not thread-safe; owned by the loop thread.
*/
class Persist {
 public:
  static constexpr int kVersion = 1;

  // Empty path keeps everything in memory; Save() becomes a no-op.
  explicit Persist(std::filesystem::path path = {});

  LoadStatus Load();
  void       Save();

  const std::filesystem::path& Path() const {
    return path_;
  }

  bool Modified() const {
    return modified_;
  }

  bool                                   Has(std::string_view path) const;
  std::optional<google::protobuf::Value> Get(std::string_view path) const;

  std::int64_t             GetInt(std::string_view path, std::int64_t fallback = 0) const;
  std::string              GetString(std::string_view path, std::string_view fallback = {}) const;
  bool                     GetBool(std::string_view path, bool fallback = false) const;
  std::vector<std::string> GetStringList(std::string_view path) const;

  void Set(std::string_view path, const google::protobuf::Value& value);
  void SetInt(std::string_view path, std::int64_t value);
  void SetString(std::string_view path, std::string_view value);
  void SetBool(std::string_view path, bool value);
  void SetStringList(std::string_view path, const std::vector<std::string>& values);

  // Removes the leaf and any parent left empty. False if absent.
  bool Remove(std::string_view path);
  void Clear();

  PersistView RootAt(std::string prefix);

  const google::protobuf::Struct& Data() const {
    return data_;
  }

 private:
  bool ReadSnapshot(const std::filesystem::path& file);

  std::filesystem::path    path_;
  google::protobuf::Struct data_;
  bool                     modified_ = false;
};

/*
  Prefix-scoped window onto a Persist. Cheap to copy; the Persist must
  outlive every view.
*/
class PersistView {
 public:
  PersistView(Persist* persist, std::string prefix);

  bool                                   Has(std::string_view path) const;
  std::optional<google::protobuf::Value> Get(std::string_view path) const;

  std::int64_t             GetInt(std::string_view path, std::int64_t fallback = 0) const;
  std::string              GetString(std::string_view path, std::string_view fallback = {}) const;
  bool                     GetBool(std::string_view path, bool fallback = false) const;
  std::vector<std::string> GetStringList(std::string_view path) const;

  void Set(std::string_view path, const google::protobuf::Value& value);
  void SetInt(std::string_view path, std::int64_t value);
  void SetString(std::string_view path, std::string_view value);
  void SetBool(std::string_view path, bool value);
  void SetStringList(std::string_view path, const std::vector<std::string>& values);

  bool Remove(std::string_view path);

  // Drops everything under the prefix.
  void Clear();

  // Flushes the whole underlying store.
  void Save();

  PersistView RootAt(std::string_view sub);

  const std::string& Prefix() const {
    return prefix_;
  }

 private:
  std::string Full(std::string_view path) const;

  Persist*    persist_;
  std::string prefix_;
};

} // namespace fleet::persist
