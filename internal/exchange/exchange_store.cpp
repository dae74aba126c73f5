#include "exchange_store.hpp"

#include <chrono>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::exchange {

ExchangeStore::ExchangeStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {}

void ExchangeStore::AddMessageContext(std::int64_t operation_id, const std::string& secure_id, const std::string& message_type) {
  MessageContext record;
  record.operation_id  = operation_id;
  record.secure_id     = secure_id;
  record.message_type  = message_type;
  record.created_at_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(util::Now().time_since_epoch()).count());

  auto tx = repository_->Begin();
  auto r  = repository_->UpsertMessageContext(*tx, record);
  if (!r) throw util::StorageError(db::Describe(r, "store operation context"));
  tx->Commit();
}

std::optional<MessageContext> ExchangeStore::GetMessageContext(std::int64_t operation_id) {
  auto tx      = repository_->Begin();
  auto context = repository_->GetMessageContext(*tx, operation_id);
  tx->Commit();
  return context;
}

void ExchangeStore::RemoveMessageContext(std::int64_t operation_id) {
  auto tx = repository_->Begin();
  auto r  = repository_->DeleteMessageContext(*tx, operation_id);
  if (!r) throw util::StorageError(db::Describe(r, "remove operation context"));
  tx->Commit();
}

} // namespace fleet::exchange
