#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace fleet::exchange {

using MessageContext = db::model::MessageContextRecord;

/*
  Operation contexts: for each server message that carried an
  "operation-id", the secure id the client held when it arrived.
*/
class ExchangeStore {
 public:
  explicit ExchangeStore(std::shared_ptr<db::Repository> repository);

  void AddMessageContext(std::int64_t operation_id, const std::string& secure_id, const std::string& message_type);

  std::optional<MessageContext> GetMessageContext(std::int64_t operation_id);

  void RemoveMessageContext(std::int64_t operation_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace fleet::exchange
