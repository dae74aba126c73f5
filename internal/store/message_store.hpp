#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/persist/persist.hpp"
#include "internal/store/message.hpp"

namespace fleet::store {

struct PendingMessage {
  std::uint64_t sequence = 0;
  Message       message;
};

struct AcceptedTypesDiff {
  std::vector<std::string> added;
  std::vector<std::string> removed;

  bool Empty() const {
    return added.empty() && removed.empty();
  }
};

/*
  Outgoing message queue with delivery guarantees.

  Bodies live in the repository; counters live in the persisted store
  under the view's prefix:

      next-sequence          next number handed out (starts at 1)
      server-ack-sequence    highest sequence the server confirmed (starts at 0)
      accepted-types         types the server currently accepts
      next-server-sequence   next server-pushed message expected
      server-uuid            identity of the server instance

  Invariants:
    - sequences are strictly increasing and never reused
    - server-ack-sequence never decreases and stays < next-sequence
    - pending == assigned, unacknowledged, non-purged sequences

  Loop-thread only.
*/
class MessageStore {
 public:
  MessageStore(std::shared_ptr<db::Repository> repository, persist::PersistView persist);

  // Reconciles the counters with the rows on disk after an unclean stop.
  void Load();

  // Replaces the accepted set; purges pending messages of removed types.
  AcceptedTypesDiff SetAcceptedTypes(const std::vector<std::string>& types);

  bool Accepts(const std::string& type) const;

  std::vector<std::string> AcceptedTypes() const;

  // Throws util::TypeRejected if the type is missing or not accepted.
  std::uint64_t Add(Message message);

  std::vector<PendingMessage> GetPendingMessages(std::size_t max_count);

  std::uint64_t CountPending();

  // True when any pending message has one of the given types.
  bool HasPendingOfType(const std::set<std::string>& types);

  // Drops every pending message up to `sequence`. Returns the new watermark.
  std::uint64_t Acknowledge(std::uint64_t sequence);

  void DeleteAllMessages();

  std::uint64_t NextSequence() const {
    return next_sequence_;
  }

  std::uint64_t ServerAckSequence() const {
    return server_ack_sequence_;
  }

  std::int64_t NextServerSequence() const;
  void         SetNextServerSequence(std::int64_t sequence);

  std::string ServerUuid() const;
  void        SetServerUuid(const std::string& uuid);

 private:
  void Check(const db::Result& result, const char* what) const;

  std::shared_ptr<db::Repository> repository_;
  persist::PersistView            persist_;

  std::set<std::string> accepted_types_;
  std::uint64_t         next_sequence_       = 1;
  std::uint64_t         server_ack_sequence_ = 0;
};

} // namespace fleet::store
