#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace fleet::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Outgoing messages
// ------------------------------------------------------------------

Result MemoryRepository::InsertMessage(Transaction& t, const model::MessageRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.messages.count(r.sequence)) return Result::Err(ErrorCode::AlreadyExists, "sequence " + std::to_string(r.sequence));
  s.messages[r.sequence] = r;
  return Result::Ok();
}

std::vector<model::MessageRecord> MemoryRepository::ListMessages(Transaction& t, std::size_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::MessageRecord> records;
  for (const auto& [_, record] : s.messages) {
    if (records.size() >= limit) break;
    records.push_back(record);
  }
  return records;
}

std::uint64_t MemoryRepository::CountMessages(Transaction& t) {
  return TX(t).View().messages.size();
}

std::optional<std::uint64_t> MemoryRepository::MaxSequence(Transaction& t) {
  const auto& s = TX(t).View();
  if (s.messages.empty()) return std::nullopt;
  return s.messages.rbegin()->first;
}

Result MemoryRepository::DeleteMessagesUpTo(Transaction& t, std::uint64_t sequence) {
  auto& s = TX(t).Mutable();
  s.messages.erase(s.messages.begin(), s.messages.upper_bound(sequence));
  return Result::Ok();
}

Result MemoryRepository::DeleteMessagesByType(Transaction& t, const std::string& type, std::uint64_t* deleted) {
  auto&         s     = TX(t).Mutable();
  std::uint64_t count = 0;
  for (auto it = s.messages.begin(); it != s.messages.end();) {
    if (it->second.type == type) {
      it = s.messages.erase(it);
      ++count;
      continue;
    }
    ++it;
  }
  if (deleted) *deleted = count;
  return Result::Ok();
}

Result MemoryRepository::DeleteAllMessages(Transaction& t) {
  TX(t).Mutable().messages.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Operation contexts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMessageContext(Transaction& t, const model::MessageContextRecord& r) {
  TX(t).Mutable().contexts[r.operation_id] = r;
  return Result::Ok();
}

std::optional<model::MessageContextRecord> MemoryRepository::GetMessageContext(Transaction& t, std::int64_t operation_id) {
  const auto& s  = TX(t).View();
  auto        it = s.contexts.find(operation_id);
  if (it == s.contexts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteMessageContext(Transaction& t, std::int64_t operation_id) {
  TX(t).Mutable().contexts.erase(operation_id);
  return Result::Ok();
}

} // namespace fleet::db::memory
