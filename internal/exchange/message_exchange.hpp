#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/exchange/exchange_store.hpp"
#include "internal/exchange/transport.hpp"
#include "internal/persist/persist.hpp"
#include "internal/reactor/reactor.hpp"
#include "internal/registration/identity.hpp"
#include "internal/store/message_store.hpp"
#include "internal/util/time.hpp"

namespace fleet::exchange {

struct ExchangeSettings {
  util::Duration exchange_interval{std::chrono::seconds(900)};
  util::Duration urgent_exchange_interval{std::chrono::seconds(60)};
  util::Duration minimum_exchange_spacing{std::chrono::seconds(10)};
  util::Duration max_backoff{std::chrono::seconds(3600)};
  util::Duration exchange_timeout{std::chrono::seconds(120)};

  std::size_t           max_messages = 100;
  bool                  heartbeat    = true;
  std::set<std::string> urgent_types{"operation-result"};

  static ExchangeSettings FromConfig(const runtime::config::ExchangeConfig& config);
};

/*
  Exchange engine.

  State machine:

      Idle --timer / urgent request--> Exchanging --response--> Idle
                                           |
                                           +--failure / timeout--> Idle (backoff)

  A response is validated in full before anything is applied; then, in
  order: acknowledgment, accepted types, server uuid, pushed messages,
  resynchronize.

  Loop-thread only. Transport callbacks are posted back through
  Reactor::CallFromThread.
*/
class MessageExchange {
 public:
  using MessageHandler       = std::function<void(const store::Message&)>;
  using RegistrationProvider = std::function<std::optional<google::protobuf::Struct>()>;

  MessageExchange(reactor::Reactor&       reactor,
                  store::MessageStore&    store,
                  ExchangeStore&          exchange_store,
                  registration::Identity& identity,
                  Transport&              transport,
                  ExchangeSettings        settings,
                  persist::PersistView    persist);
  ~MessageExchange();

  MessageExchange(const MessageExchange&)            = delete;
  MessageExchange& operator=(const MessageExchange&) = delete;

  // Arms the first exchange.
  void Start();

  // Cancels timers and abandons an in-flight attempt.
  void Stop();

  // Queues a message. Returns nullopt when an operation result belongs to a
  // previous identity and was dropped. Throws util::TypeRejected.
  std::optional<std::uint64_t> Send(store::Message message, bool urgent = false);

  // Urgent requests only ever move the next exchange earlier.
  void ScheduleExchange(bool urgent = false);

  // Starts an exchange now unless one is in flight.
  void Exchange();

  // Server-pushed messages of `type` go to `handler`. Types are advertised
  // in client_accepted_types.
  void RegisterMessage(const std::string& type, MessageHandler handler);

  std::vector<std::string> ClientAcceptedTypes() const;

  void SetRegistrationProvider(RegistrationProvider provider) {
    registration_provider_ = std::move(provider);
  }

  // Fires the resynchronize event and asks for an urgent exchange.
  void Resynchronize(const std::string& reason);

  // Same as Resynchronize, but while a response is being applied the event
  // is merged into the single one fired once the response is done.
  void RequestResynchronize(const std::string& reason);

  bool IsUrgent() const {
    return urgent_;
  }
  bool Exchanging() const {
    return exchanging_;
  }
  int FailureCount() const {
    return failure_count_;
  }
  util::Duration ExchangeInterval() const {
    return settings_.exchange_interval;
  }
  util::Duration UrgentExchangeInterval() const {
    return settings_.urgent_exchange_interval;
  }

  // Due time of the armed exchange, if any.
  std::optional<util::TimePoint> NextExchangeTime() const {
    return next_exchange_time_;
  }

  // Delay after `failures` consecutive failures for the given base interval.
  static util::Duration Backoff(util::Duration interval, util::Duration max_backoff, int failures);

 private:
  v1::ExchangeRequest BuildRequest(std::size_t* sent);
  void                OnTimer();
  void                OnTimeout(std::uint64_t attempt);
  void                OnResult(std::uint64_t attempt, TransportResult result);
  void                Validate(const v1::ExchangeResponse& response) const;
  void                Apply(const v1::ExchangeResponse& response, std::size_t sent);
  void                Dispatch(const store::Message& message);
  void                Succeed(std::size_t sent);
  void                Fail(const std::string& reason);
  void                ScheduleNext();
  void                Arm(util::TimePoint fire_at);
  void                Disarm();

  void HandleSetIntervals(const store::Message& message);

  reactor::Reactor&       reactor_;
  store::MessageStore&    store_;
  ExchangeStore&          exchange_store_;
  registration::Identity& identity_;
  Transport&              transport_;
  ExchangeSettings        settings_;
  persist::PersistView    persist_;

  std::map<std::string, MessageHandler> handlers_;
  RegistrationProvider                  registration_provider_;

  bool          started_        = false;
  bool          urgent_         = false;
  bool          exchanging_     = false;
  int           failure_count_  = 0;
  std::uint64_t attempt_id_     = 0;

  // urgency requested while an exchange was in flight
  bool urgent_requested_ = false;

  std::size_t in_flight_sent_ = 0;

  // resynchronize requested while applying a response; survives a failed apply
  std::string resync_reason_;

  std::optional<util::TimePoint>          last_exchange_;
  std::optional<util::TimePoint>          next_exchange_time_;
  std::optional<reactor::Reactor::CallId> next_call_;
  std::optional<reactor::Reactor::CallId> timeout_call_;

  // transport callbacks outliving the engine see an expired token
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace fleet::exchange
