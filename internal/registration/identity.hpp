#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/persist/persist.hpp"

namespace fleet::registration {

/*
  Who this computer is to the server.

  Ids are persisted under the view ("secure-id", "insecure-id"); the
  descriptive fields come from the client config and never change at
  runtime.
*/
class Identity {
 public:
  Identity(persist::PersistView persist, const runtime::config::ClientConfig& config);

  std::string SecureId() const;
  std::string InsecureId() const;

  bool Registered() const {
    return !SecureId().empty();
  }

  void SetIds(const std::string& secure_id, const std::string& insecure_id);

  // Forgets both ids.
  void Clear();

  const std::string& ComputerTitle() const {
    return computer_title_;
  }
  const std::string& AccountName() const {
    return account_name_;
  }
  const std::string& RegistrationKey() const {
    return registration_key_;
  }
  const std::vector<std::string>& Tags() const {
    return tags_;
  }

 private:
  persist::PersistView persist_;

  std::string              computer_title_;
  std::string              account_name_;
  std::string              registration_key_;
  std::vector<std::string> tags_;
};

} // namespace fleet::registration
