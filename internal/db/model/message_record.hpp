#pragma once

#include <cstdint>
#include <string>

namespace fleet::db::model {

/*
  One queued outgoing message.

  The body is the message Struct serialized as JSON text.
*/

struct MessageRecord {
  std::uint64_t sequence = 0;

  // copy of the body's "type" field, indexed for accepted-type purges
  std::string type;

  std::string json;

  // enqueue time (epoch ms)
  std::uint64_t created_at_ms = 0;
};

} // namespace fleet::db::model
