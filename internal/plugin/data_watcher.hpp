#pragma once

#include <optional>
#include <string>

#include "internal/plugin/plugin.hpp"

namespace fleet::plugin {

/*
  Plugin that sends one message type, and only when its content changed
  since the last delivery. The last sent body is kept in the plugin's
  persist view so restarts do not resend; Resynchronize() forgets it.
*/
class DataWatcher : public Plugin {
 public:
  explicit DataWatcher(std::string message_type);

  unsigned Capabilities() const override {
    return kRun | kExchange | kResynchronize;
  }

  void Run() override;
  void Exchange() override;
  void Resynchronize() override;

  const std::string& MessageType() const {
    return message_type_;
  }

 protected:
  // Current state as a message of MessageType(); nullopt to skip.
  virtual std::optional<store::Message> Collect() = 0;

 private:
  void SendIfChanged();

  std::string message_type_;
};

} // namespace fleet::plugin
