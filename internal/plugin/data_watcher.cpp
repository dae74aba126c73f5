#include "data_watcher.hpp"

#include <google/protobuf/util/message_differencer.h>

#include "internal/observability/logging.hpp"

namespace fleet::plugin {

using fleet::observability::IntField;
using fleet::observability::StringField;

namespace {
constexpr const char* kLastSent = "last-sent";
}

DataWatcher::DataWatcher(std::string message_type) : message_type_(std::move(message_type)) {}

void DataWatcher::Run() {
  SendIfChanged();
}

void DataWatcher::Exchange() {
  SendIfChanged();
}

void DataWatcher::Resynchronize() {
  if (context_) context_->persist.Remove(kLastSent);
}

void DataWatcher::SendIfChanged() {
  if (!context_ || !context_->sink->Accepts(message_type_)) return;

  auto message = Collect();
  if (!message) return;

  // field order of the stored JSON is not stable
  const std::string body = store::ToJson(*message);
  const std::string last = context_->persist.GetString(kLastSent);
  if (!last.empty() && google::protobuf::util::MessageDifferencer::Equals(store::FromJson(last), *message)) return;

  auto sequence = context_->sink->Send(std::move(*message));
  if (!sequence) return;

  context_->persist.SetString(kLastSent, body);
  FLEET_LOG_DEBUG("Plugin data sent", {StringField("plugin", Name()), IntField("sequence", static_cast<std::int64_t>(*sequence))});
}

} // namespace fleet::plugin
