#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fleet::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMessage(Transaction&, const model::MessageRecord&) override;
  std::vector<model::MessageRecord> ListMessages(Transaction&, std::size_t limit) override;
  std::uint64_t CountMessages(Transaction&) override;
  std::optional<std::uint64_t> MaxSequence(Transaction&) override;
  Result DeleteMessagesUpTo(Transaction&, std::uint64_t sequence) override;
  Result DeleteMessagesByType(Transaction&, const std::string& type, std::uint64_t* deleted) override;
  Result DeleteAllMessages(Transaction&) override;

  Result UpsertMessageContext(Transaction&, const model::MessageContextRecord&) override;
  std::optional<model::MessageContextRecord> GetMessageContext(Transaction&, std::int64_t operation_id) override;
  Result DeleteMessageContext(Transaction&, std::int64_t operation_id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::uint64_t, model::MessageRecord> messages;
    std::unordered_map<std::int64_t, model::MessageContextRecord> contexts;
  };

  std::mutex mutex_;
  State committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace fleet::db::memory
