#pragma once

#include <cstdint>
#include <string>

namespace fleet::db::model {

/*
  Context of a server message carrying an operation id: the secure id the
  client held when the operation arrived.
*/

struct MessageContextRecord {
  std::int64_t operation_id = 0;
  std::string  secure_id;
  std::string  message_type;
  std::uint64_t created_at_ms = 0;
};

} // namespace fleet::db::model
