#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/message_context_record.hpp"
#include "internal/db/model/message_record.hpp"

namespace fleet::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Outgoing messages are listed in ascending sequence order

  The DB is the source of truth for:
    queued outgoing message bodies
    operation contexts of server messages
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Outgoing messages
  // ---------------------------------------------------------------------

  virtual Result InsertMessage(Transaction&, const model::MessageRecord&) = 0;

  // First `limit` messages by ascending sequence.
  virtual std::vector<model::MessageRecord> ListMessages(Transaction&, std::size_t limit) = 0;

  virtual std::uint64_t CountMessages(Transaction&) = 0;

  virtual std::optional<std::uint64_t> MaxSequence(Transaction&) = 0;

  // Deletes every message with sequence <= `sequence`.
  virtual Result DeleteMessagesUpTo(Transaction&, std::uint64_t sequence) = 0;

  virtual Result DeleteMessagesByType(Transaction&, const std::string& type, std::uint64_t* deleted) = 0;

  virtual Result DeleteAllMessages(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Operation contexts
  // ---------------------------------------------------------------------

  virtual Result UpsertMessageContext(Transaction&, const model::MessageContextRecord&) = 0;

  virtual std::optional<model::MessageContextRecord> GetMessageContext(Transaction&, std::int64_t operation_id) = 0;

  virtual Result DeleteMessageContext(Transaction&, std::int64_t operation_id) = 0;
};

} // namespace fleet::db
