#include "message_store.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

#include "api/fleet/exchange/v1.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::store {

using fleet::observability::IntField;
using fleet::observability::StringField;

namespace {

constexpr const char* kNextSequence       = "next-sequence";
constexpr const char* kServerAckSequence  = "server-ack-sequence";
constexpr const char* kAcceptedTypes      = "accepted-types";
constexpr const char* kNextServerSequence = "next-server-sequence";
constexpr const char* kServerUuid         = "server-uuid";

std::uint64_t NowMs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(util::Now().time_since_epoch()).count());
}

} // namespace

MessageStore::MessageStore(std::shared_ptr<db::Repository> repository, persist::PersistView persist)
    : repository_(std::move(repository)), persist_(std::move(persist)) {
  const auto types = persist_.GetStringList(kAcceptedTypes);
  accepted_types_.insert(types.begin(), types.end());
  next_sequence_       = static_cast<std::uint64_t>(std::max<std::int64_t>(1, persist_.GetInt(kNextSequence, 1)));
  server_ack_sequence_ = static_cast<std::uint64_t>(std::max<std::int64_t>(0, persist_.GetInt(kServerAckSequence, 0)));
}

void MessageStore::Check(const db::Result& result, const char* what) const {
  if (!result) throw util::StorageError(db::Describe(result, what));
}

void MessageStore::Load() {
  const auto types = persist_.GetStringList(kAcceptedTypes);
  accepted_types_  = std::set<std::string>(types.begin(), types.end());

  auto persisted_next = static_cast<std::uint64_t>(std::max<std::int64_t>(1, persist_.GetInt(kNextSequence, 1)));
  auto persisted_ack  = static_cast<std::uint64_t>(std::max<std::int64_t>(0, persist_.GetInt(kServerAckSequence, 0)));

  auto tx  = repository_->Begin();
  auto max = repository_->MaxSequence(*tx);

  // a row written after the last counter flush must not be reissued
  next_sequence_       = max ? std::max(persisted_next, *max + 1) : persisted_next;
  server_ack_sequence_ = std::min(persisted_ack, next_sequence_ - 1);

  // rows acknowledged but not yet deleted when the process stopped
  Check(repository_->DeleteMessagesUpTo(*tx, server_ack_sequence_), "purge acknowledged");
  const auto pending = repository_->CountMessages(*tx);
  tx->Commit();

  if (next_sequence_ != persisted_next || server_ack_sequence_ != persisted_ack) {
    FLEET_LOG_WARN("Message store counters reconciled",
                   {IntField("next_sequence", static_cast<std::int64_t>(next_sequence_)),
                    IntField("persisted_next_sequence", static_cast<std::int64_t>(persisted_next)),
                    IntField("server_ack_sequence", static_cast<std::int64_t>(server_ack_sequence_))});
  }

  persist_.SetInt(kNextSequence, static_cast<std::int64_t>(next_sequence_));
  persist_.SetInt(kServerAckSequence, static_cast<std::int64_t>(server_ack_sequence_));

  FLEET_LOG_INFO("Message store loaded",
                 {IntField("pending", static_cast<std::int64_t>(pending)),
                  IntField("next_sequence", static_cast<std::int64_t>(next_sequence_)),
                  IntField("accepted_types", static_cast<std::int64_t>(accepted_types_.size()))});
}

// ------------------------------------------------------------------
// Accepted types
// ------------------------------------------------------------------

AcceptedTypesDiff MessageStore::SetAcceptedTypes(const std::vector<std::string>& types) {
  std::set<std::string> next(types.begin(), types.end());

  AcceptedTypesDiff diff;
  std::set_difference(next.begin(), next.end(), accepted_types_.begin(), accepted_types_.end(), std::back_inserter(diff.added));
  std::set_difference(accepted_types_.begin(), accepted_types_.end(), next.begin(), next.end(), std::back_inserter(diff.removed));

  if (diff.Empty()) return diff;

  if (!diff.removed.empty()) {
    auto tx = repository_->Begin();
    for (const auto& type : diff.removed) {
      std::uint64_t deleted = 0;
      Check(repository_->DeleteMessagesByType(*tx, type, &deleted), "purge rejected type");
      if (deleted > 0) {
        FLEET_LOG_INFO("Purged pending messages of a type no longer accepted",
                       {StringField("type", type), IntField("count", static_cast<std::int64_t>(deleted))});
      }
    }
    tx->Commit();
  }

  accepted_types_ = std::move(next);
  persist_.SetStringList(kAcceptedTypes, AcceptedTypes());
  return diff;
}

bool MessageStore::Accepts(const std::string& type) const {
  return accepted_types_.count(type) > 0;
}

std::vector<std::string> MessageStore::AcceptedTypes() const {
  return {accepted_types_.begin(), accepted_types_.end()};
}

// ------------------------------------------------------------------
// Queue
// ------------------------------------------------------------------

std::uint64_t MessageStore::Add(Message message) {
  const std::string type = MessageType(message);
  if (type.empty()) throw util::TypeRejected("message has no type");
  if (!Accepts(type)) throw util::TypeRejected("message type not accepted: " + type);

  if (!GetString(message, "api")) SetString(message, "api", exchange::v1::kApiVersion);

  db::model::MessageRecord record;
  record.sequence      = next_sequence_;
  record.type          = type;
  record.json          = ToJson(message);
  record.created_at_ms = NowMs();

  auto tx = repository_->Begin();
  Check(repository_->InsertMessage(*tx, record), "insert message");
  tx->Commit();

  ++next_sequence_;
  persist_.SetInt(kNextSequence, static_cast<std::int64_t>(next_sequence_));

  FLEET_LOG_DEBUG("Message queued", {StringField("type", type), IntField("sequence", static_cast<std::int64_t>(record.sequence))});
  return record.sequence;
}

std::vector<PendingMessage> MessageStore::GetPendingMessages(std::size_t max_count) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListMessages(*tx, max_count);
  tx->Commit();

  std::vector<PendingMessage> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    try {
      out.push_back(PendingMessage{r.sequence, FromJson(r.json)});
    } catch (const std::runtime_error& e) {
      // still delivered positionally so the watermark can move past it
      FLEET_LOG_ERROR("Stored message unreadable", {IntField("sequence", static_cast<std::int64_t>(r.sequence)), StringField("error", e.what())});
      out.push_back(PendingMessage{r.sequence, MakeMessage(r.type)});
    }
  }
  return out;
}

std::uint64_t MessageStore::CountPending() {
  auto tx    = repository_->Begin();
  auto count = repository_->CountMessages(*tx);
  tx->Commit();
  return count;
}

bool MessageStore::HasPendingOfType(const std::set<std::string>& types) {
  if (types.empty()) return false;

  auto tx      = repository_->Begin();
  auto records = repository_->ListMessages(*tx, std::numeric_limits<std::size_t>::max());
  tx->Commit();

  return std::any_of(records.begin(), records.end(), [&](const db::model::MessageRecord& r) { return types.count(r.type) > 0; });
}

std::uint64_t MessageStore::Acknowledge(std::uint64_t sequence) {
  if (sequence <= server_ack_sequence_) return server_ack_sequence_;

  const std::uint64_t highest = next_sequence_ - 1;
  if (sequence > highest) {
    FLEET_LOG_WARN("Acknowledgment beyond last assigned sequence; clamping",
                   {IntField("acknowledged", static_cast<std::int64_t>(sequence)), IntField("highest", static_cast<std::int64_t>(highest))});
    sequence = highest;
    if (sequence <= server_ack_sequence_) return server_ack_sequence_;
  }

  // watermark reaches disk before the rows go away
  server_ack_sequence_ = sequence;
  persist_.SetInt(kServerAckSequence, static_cast<std::int64_t>(server_ack_sequence_));
  persist_.Save();

  auto tx = repository_->Begin();
  Check(repository_->DeleteMessagesUpTo(*tx, server_ack_sequence_), "delete acknowledged");
  tx->Commit();

  return server_ack_sequence_;
}

void MessageStore::DeleteAllMessages() {
  auto tx = repository_->Begin();
  Check(repository_->DeleteAllMessages(*tx), "delete all messages");
  tx->Commit();
}

// ------------------------------------------------------------------
// Server side
// ------------------------------------------------------------------

std::int64_t MessageStore::NextServerSequence() const {
  return persist_.GetInt(kNextServerSequence, 0);
}

void MessageStore::SetNextServerSequence(std::int64_t sequence) {
  persist_.SetInt(kNextServerSequence, sequence);
}

std::string MessageStore::ServerUuid() const {
  return persist_.GetString(kServerUuid);
}

void MessageStore::SetServerUuid(const std::string& uuid) {
  if (uuid.empty()) {
    persist_.Remove(kServerUuid);
    return;
  }
  persist_.SetString(kServerUuid, uuid);
}

} // namespace fleet::store
