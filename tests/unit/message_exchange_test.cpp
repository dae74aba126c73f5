#include "internal/exchange/message_exchange.hpp"

#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/exchange_harness.hpp"

namespace {

using namespace std::chrono_literals;

using fleet::exchange::ExchangeSettings;
using fleet::exchange::MessageExchange;
using fleet::reactor::Event;
using fleet::reactor::EventData;
using fleet::store::MakeMessage;
using fleet::testing::ExchangeHarness;

struct EventLog {
  EventLog(ExchangeHarness& h, Event event) {
    h.reactor.CallOn(event, [this](const EventData& data) { fired.push_back(data); });
  }
  std::vector<EventData> fired;
};

// In-memory repository whose operation-context writes can be made to fail.
class ContextFailingRepository final : public fleet::db::Repository {
 public:
  using Transaction = fleet::db::Transaction;
  using Result      = fleet::db::Result;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }
  Result InsertMessage(Transaction& tx, const fleet::db::model::MessageRecord& r) override {
    return inner_.InsertMessage(tx, r);
  }
  std::vector<fleet::db::model::MessageRecord> ListMessages(Transaction& tx, std::size_t limit) override {
    return inner_.ListMessages(tx, limit);
  }
  std::uint64_t CountMessages(Transaction& tx) override {
    return inner_.CountMessages(tx);
  }
  std::optional<std::uint64_t> MaxSequence(Transaction& tx) override {
    return inner_.MaxSequence(tx);
  }
  Result DeleteMessagesUpTo(Transaction& tx, std::uint64_t sequence) override {
    return inner_.DeleteMessagesUpTo(tx, sequence);
  }
  Result DeleteMessagesByType(Transaction& tx, const std::string& type, std::uint64_t* deleted) override {
    return inner_.DeleteMessagesByType(tx, type, deleted);
  }
  Result DeleteAllMessages(Transaction& tx) override {
    return inner_.DeleteAllMessages(tx);
  }
  Result UpsertMessageContext(Transaction& tx, const fleet::db::model::MessageContextRecord& r) override {
    if (fail_contexts) return Result::Err(fleet::db::ErrorCode::IOError, "disk full");
    return inner_.UpsertMessageContext(tx, r);
  }
  std::optional<fleet::db::model::MessageContextRecord> GetMessageContext(Transaction& tx, std::int64_t operation_id) override {
    return inner_.GetMessageContext(tx, operation_id);
  }
  Result DeleteMessageContext(Transaction& tx, std::int64_t operation_id) override {
    return inner_.DeleteMessageContext(tx, operation_id);
  }

  bool fail_contexts = false;

 private:
  fleet::db::memory::MemoryRepository inner_;
};

void FailWith(ExchangeHarness& h, std::exception_ptr error) {
  h.transport.Fail(std::move(error));
  h.reactor.RunPosted();
}

void TestBackoffDoublesUpToCap() {
  assert(MessageExchange::Backoff(60s, 3600s, 0) == 60s);
  assert(MessageExchange::Backoff(60s, 3600s, 1) == 120s);
  assert(MessageExchange::Backoff(60s, 3600s, 2) == 240s);
  assert(MessageExchange::Backoff(60s, 3600s, 10) == 3600s);
  assert(MessageExchange::Backoff(900s, 3600s, 3) == 3600s);

  // an interval above the cap is never shortened
  assert(MessageExchange::Backoff(7200s, 3600s, 2) == 7200s);
}

void TestQueuedMessagesAreSentAndAcknowledged() {
  ExchangeHarness h;
  h.Accept({"test"});
  h.exchange.Start();

  assert(h.exchange.Send(MakeMessage("test")) == 1u);
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 900s);

  h.RunNextExchange();
  assert(h.exchange.Exchanging());

  const auto& request = h.transport.LastRequest();
  assert(request.api() == "3.2");
  assert(request.secure_id() == "secure-1");
  assert(request.insecure_id() == "insecure-1");
  assert(request.sequence() == 1);
  assert(request.messages_size() == 1);
  assert(request.total_messages() == 0);
  assert(!request.has_registration());

  h.Respond(ExchangeHarness::Ack(2));
  assert(!h.exchange.Exchanging());
  assert(h.store.ServerAckSequence() == 1);
  assert(h.store.CountPending() == 0);
  assert(!h.exchange.IsUrgent());
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 900s);
}

void TestBatchLimitKeepsExchangeUrgent() {
  ExchangeSettings settings;
  settings.max_messages = 2;
  ExchangeHarness h(settings);
  h.Accept({"test"});
  h.exchange.Start();
  for (int i = 0; i < 5; ++i) h.exchange.Send(MakeMessage("test"));

  h.RunNextExchange();
  assert(h.transport.LastRequest().messages_size() == 2);
  assert(h.transport.LastRequest().total_messages() == 3);

  h.Respond(ExchangeHarness::Ack(3));
  assert(h.exchange.IsUrgent());
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 60s);

  h.RunNextExchange();
  assert(h.transport.LastRequest().sequence() == 3);
}

void TestFailuresBackOffAndRecover() {
  ExchangeHarness h;
  EventLog        failed(h, Event::kExchangeFailed);
  h.exchange.Start();

  h.RunNextExchange();
  FailWith(h, std::make_exception_ptr(fleet::util::TransmissionFailure("connection refused")));
  assert(h.exchange.FailureCount() == 1);
  assert(failed.fired.size() == 1);
  assert(failed.fired[0].detail == "connection refused");
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 1800s);

  // a backoff is not cut short by urgent requests
  h.exchange.ScheduleExchange(true);
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 1800s);

  h.RunNextExchange();
  FailWith(h, std::make_exception_ptr(fleet::util::TransmissionFailure("connection refused")));
  assert(h.exchange.FailureCount() == 2);

  h.RunNextExchange();
  h.Respond(ExchangeHarness::Ack(1));
  assert(h.exchange.FailureCount() == 0);
}

void TestUrgentExchangeHonorsMinimumSpacing() {
  ExchangeSettings settings;
  settings.urgent_exchange_interval = 1s;
  settings.minimum_exchange_spacing = 10s;
  ExchangeHarness h(settings);
  h.Accept({"operation-result"});
  h.exchange.Start();

  h.RunNextExchange();
  h.Respond(ExchangeHarness::Ack(1));
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 900s);

  h.exchange.Send(MakeMessage("operation-result"));
  assert(h.exchange.IsUrgent());
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 10s);

  h.reactor.Advance(5s);
  h.exchange.ScheduleExchange(true);
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 5s);
}

void TestUrgentRequestDuringExchangeIsKept() {
  ExchangeHarness h;
  h.Accept({"test"});
  h.exchange.Start();

  h.RunNextExchange();
  h.exchange.Send(MakeMessage("test"), true);
  assert(h.transport.LastRequest().messages_size() == 0);

  h.Respond(ExchangeHarness::Ack(1));
  assert(h.exchange.IsUrgent());
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 60s);

  h.RunNextExchange();
  assert(h.transport.LastRequest().messages_size() == 1);
  h.Respond(ExchangeHarness::Ack(2));
  assert(!h.exchange.IsUrgent());
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 900s);
}

void TestResynchronizeRunsBeforeNextRegularExchange() {
  ExchangeHarness h;
  EventLog        resync(h, Event::kResynchronize);
  h.exchange.Start();

  h.RunNextExchange();
  auto response = ExchangeHarness::Ack(1);
  response.set_resynchronize(true);
  h.Respond(response);

  assert(resync.fired.size() == 1);
  assert(h.exchange.IsUrgent());
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 60s);

  // the same through a pushed message
  h.RunNextExchange();
  const auto before = h.store.NextServerSequence();
  response          = ExchangeHarness::Ack(1);
  *response.add_messages() = MakeMessage("resynchronize");
  h.Respond(response);

  assert(resync.fired.size() == 2);
  assert(h.store.NextServerSequence() == before + 1);
  assert(h.transport.LastRequest().next_expected_sequence() == before);
}

void TestMalformedResponseAppliesNothing() {
  ExchangeHarness h;
  h.Accept({"test"});
  h.exchange.Start();
  h.exchange.Send(MakeMessage("test"));

  h.RunNextExchange();
  auto response = ExchangeHarness::Ack(2);
  response.mutable_accepted_types()->add_types("other");
  fleet::store::Message untyped;
  fleet::store::SetString(untyped, "body", "no type");
  *response.add_messages() = untyped;
  h.Respond(response);

  assert(h.exchange.FailureCount() == 1);
  assert(h.store.ServerAckSequence() == 0);
  assert(h.store.CountPending() == 1);
  assert(h.store.Accepts("test"));
  assert(!h.store.Accepts("other"));
  assert(h.store.NextServerSequence() == 0);

  h.RunNextExchange();
  h.Respond(ExchangeHarness::Ack(-4));
  assert(h.exchange.FailureCount() == 2);
  assert(h.store.CountPending() == 1);
}

void TestTimeoutDiscardsLateResponse() {
  ExchangeHarness h;
  h.Accept({"test"});
  h.exchange.Start();
  h.exchange.Send(MakeMessage("test"));

  h.RunNextExchange();
  h.reactor.Advance(120s);
  assert(!h.exchange.Exchanging());
  assert(h.exchange.FailureCount() == 1);

  h.Respond(ExchangeHarness::Ack(2));
  assert(h.store.ServerAckSequence() == 0);
  assert(h.store.CountPending() == 1);
  assert(h.exchange.FailureCount() == 1);
}

void TestIdentityRejectionFiresEvent() {
  ExchangeHarness h;
  EventLog        rejected(h, Event::kIdentityRejected);
  h.exchange.Start();

  h.RunNextExchange();
  FailWith(h, std::make_exception_ptr(fleet::util::IdentityRejected("unknown secure id")));
  assert(rejected.fired.size() == 1);
  assert(h.exchange.FailureCount() == 1);
}

void TestServerCanChangeIntervals() {
  ExchangeHarness h;
  h.exchange.Start();

  h.RunNextExchange();
  auto response = ExchangeHarness::Ack(1);
  auto message  = MakeMessage("set-intervals");
  fleet::store::SetInt(message, "exchange", 300);
  fleet::store::SetInt(message, "urgent-exchange", 30);
  *response.add_messages() = message;
  h.Respond(response);

  assert(h.exchange.ExchangeInterval() == 300s);
  assert(h.exchange.UrgentExchangeInterval() == 30s);
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 300s);
  assert(h.persist.GetInt("exchange.exchange-interval") == 300);

  MessageExchange restarted(h.reactor, h.store, h.exchange_store, h.identity, h.transport, ExchangeSettings{}, h.persist.RootAt("exchange"));
  assert(restarted.ExchangeInterval() == 300s);
  assert(restarted.UrgentExchangeInterval() == 30s);
}

void TestServerUuidChangeResynchronizes() {
  ExchangeHarness h;
  EventLog        changed(h, Event::kServerUuidChanged);
  EventLog        resync(h, Event::kResynchronize);
  h.exchange.Start();

  h.RunNextExchange();
  auto response = ExchangeHarness::Ack(1);
  response.set_server_uuid("uuid-a");
  h.Respond(response);
  assert(h.store.ServerUuid() == "uuid-a");
  assert(changed.fired.empty());
  assert(resync.fired.empty());

  h.RunNextExchange();
  response.set_server_uuid("uuid-b");
  h.Respond(response);
  assert(changed.fired.size() == 1);
  assert(changed.fired[0].detail == "uuid-b");
  assert(resync.fired.size() == 1);
  assert(h.store.ServerUuid() == "uuid-b");
}

void TestServerBehindAcknowledgmentResynchronizes() {
  ExchangeHarness h;
  EventLog        resync(h, Event::kResynchronize);
  h.Accept({"test"});
  h.exchange.Start();
  h.exchange.Send(MakeMessage("test"));
  h.exchange.Send(MakeMessage("test"));

  h.RunNextExchange();
  h.Respond(ExchangeHarness::Ack(3));
  assert(h.store.ServerAckSequence() == 2);

  h.RunNextExchange();
  h.Respond(ExchangeHarness::Ack(1));
  assert(h.store.ServerAckSequence() == 2);
  assert(resync.fired.size() == 1);
  assert(h.exchange.FailureCount() == 0);
}

void TestAcceptedTypeChangesFireEvents() {
  ExchangeHarness h;
  EventLog        changes(h, Event::kMessageTypeAcceptanceChanged);
  h.exchange.Start();

  h.RunNextExchange();
  auto response = ExchangeHarness::Ack(1);
  response.mutable_accepted_types()->add_types("a");
  response.mutable_accepted_types()->add_types("b");
  h.Respond(response);
  assert(changes.fired.size() == 2);
  assert(changes.fired[0].flag && changes.fired[1].flag);

  h.RunNextExchange();
  response = ExchangeHarness::Ack(1);
  response.mutable_accepted_types()->add_types("b");
  h.Respond(response);
  assert(changes.fired.size() == 3);
  assert(changes.fired[2].type == "a");
  assert(!changes.fired[2].flag);
}

void TestOperationResultOfPreviousIdentityIsDropped() {
  ExchangeHarness h;
  h.Accept({"operation-result"});
  std::vector<std::string> handled;
  h.exchange.RegisterMessage("shutdown", [&](const fleet::store::Message& m) { handled.push_back(fleet::store::MessageType(m)); });
  h.exchange.Start();

  h.RunNextExchange();
  auto response = ExchangeHarness::Ack(1);
  for (int operation_id : {7, 8}) {
    auto message = MakeMessage("shutdown");
    fleet::store::SetInt(message, "operation-id", operation_id);
    *response.add_messages() = message;
  }
  h.Respond(response);
  assert(handled.size() == 2);

  auto result = MakeMessage("operation-result");
  fleet::store::SetInt(result, "operation-id", 8);
  assert(h.exchange.Send(result).has_value());

  h.identity.SetIds("secure-2", "insecure-2");
  auto stale = MakeMessage("operation-result");
  fleet::store::SetInt(stale, "operation-id", 7);
  assert(!h.exchange.Send(stale).has_value());
  assert(h.store.CountPending() == 1);
  assert(!h.exchange_store.GetMessageContext(7).has_value());
}

void TestWithoutHeartbeatIdleExchangesAreSkipped() {
  ExchangeSettings settings;
  settings.heartbeat = false;
  ExchangeHarness h(settings);
  h.exchange.Start();

  h.RunNextExchange();
  assert(h.transport.requests.empty());
  assert(!h.exchange.Exchanging());
  assert(h.exchange.NextExchangeTime() == h.reactor.Now() + 900s);
}

void TestUnregisteredClientHoldsMessagesBack() {
  ExchangeHarness h({}, fleet::testing::DefaultClient(), false);
  h.Accept({"test"});
  h.exchange.SetRegistrationProvider([] {
    auto payload = MakeMessage("register");
    fleet::store::SetString(payload, "account-name", "acme");
    return std::optional<fleet::store::Message>(payload);
  });
  h.exchange.Start();
  h.exchange.Send(MakeMessage("test"));

  h.RunNextExchange();
  const auto& request = h.transport.LastRequest();
  assert(request.secure_id().empty());
  assert(request.has_registration());
  assert(request.messages_size() == 0);
  assert(request.total_messages() == 1);
  assert(request.sequence() == 1);

  // the server acknowledges exactly what it was told about
  const auto next_expected = request.sequence() + request.messages_size();
  h.Respond(ExchangeHarness::Ack(next_expected));
  assert(h.store.CountPending() == 1);
  assert(h.store.ServerAckSequence() == 0);
  assert(h.exchange.IsUrgent());

  h.RunNextExchange();
  assert(h.transport.LastRequest().sequence() == 1);
  assert(h.transport.LastRequest().messages_size() == 0);
  h.Respond(ExchangeHarness::Ack(h.transport.LastRequest().sequence()));
  assert(h.store.CountPending() == 1);
}

void TestUnregisteredEmptyQueueReportsNextSequence() {
  ExchangeHarness h({}, fleet::testing::DefaultClient(), false);
  h.Accept({"test"});
  h.store.Add(MakeMessage("test"));
  h.store.Acknowledge(1);
  h.exchange.Start();

  h.exchange.Exchange();
  assert(h.transport.LastRequest().sequence() == 2);
  assert(h.transport.LastRequest().total_messages() == 0);
}

void TestInterruptedApplyKeepsAckAndReceivesPushAgain() {
  auto            backend = std::make_shared<ContextFailingRepository>();
  ExchangeHarness h({}, fleet::testing::DefaultClient(), true, backend);
  h.Accept({"test"});
  int handled = 0;
  h.exchange.RegisterMessage("shutdown", [&](const fleet::store::Message&) { ++handled; });
  h.exchange.Start();
  h.exchange.Send(MakeMessage("test"));
  h.exchange.Send(MakeMessage("test"));

  const auto server_sequence = h.store.NextServerSequence();
  auto       shutdown        = MakeMessage("shutdown");
  fleet::store::SetInt(shutdown, "operation-id", 12);

  backend->fail_contexts = true;
  h.RunNextExchange();
  assert(h.transport.LastRequest().messages_size() == 2);
  auto response            = ExchangeHarness::Ack(3);
  *response.add_messages() = shutdown;
  h.Respond(response);

  // the acknowledgment stands; the pushed message counts as not received
  assert(h.exchange.FailureCount() == 1);
  assert(h.store.ServerAckSequence() == 2);
  assert(h.store.CountPending() == 0);
  assert(h.store.NextServerSequence() == server_sequence);
  assert(handled == 0);

  backend->fail_contexts = false;
  h.RunNextExchange();
  const auto& retry = h.transport.LastRequest();
  assert(retry.sequence() == 3);
  assert(retry.messages_size() == 0);
  assert(retry.next_expected_sequence() == server_sequence);

  h.Respond(response);
  assert(h.exchange.FailureCount() == 0);
  assert(h.store.ServerAckSequence() == 2);
  assert(h.store.NextServerSequence() == server_sequence + 1);
  assert(handled == 1);
}

void TestStopAbandonsInFlightExchange() {
  ExchangeHarness h;
  h.Accept({"test"});
  h.exchange.Start();
  h.exchange.Send(MakeMessage("test"));

  h.RunNextExchange();
  h.exchange.Stop();
  assert(!h.exchange.Exchanging());
  assert(!h.exchange.NextExchangeTime().has_value());

  h.Respond(ExchangeHarness::Ack(2));
  assert(h.store.CountPending() == 1);
}

} // namespace

int main() {
  TestBackoffDoublesUpToCap();
  TestQueuedMessagesAreSentAndAcknowledged();
  TestBatchLimitKeepsExchangeUrgent();
  TestFailuresBackOffAndRecover();
  TestUrgentExchangeHonorsMinimumSpacing();
  TestUrgentRequestDuringExchangeIsKept();
  TestResynchronizeRunsBeforeNextRegularExchange();
  TestMalformedResponseAppliesNothing();
  TestTimeoutDiscardsLateResponse();
  TestIdentityRejectionFiresEvent();
  TestServerCanChangeIntervals();
  TestServerUuidChangeResynchronizes();
  TestServerBehindAcknowledgmentResynchronizes();
  TestAcceptedTypeChangesFireEvents();
  TestOperationResultOfPreviousIdentityIsDropped();
  TestWithoutHeartbeatIdleExchangesAreSkipped();
  TestUnregisteredClientHoldsMessagesBack();
  TestUnregisteredEmptyQueueReportsNextSequence();
  TestInterruptedApplyKeepsAckAndReceivesPushAgain();
  TestStopAbandonsInFlightExchange();

  std::cout << "fleet_agent_unit_message_exchange: pass\n";
  return 0;
}
