#include "identity.hpp"

namespace fleet::registration {

Identity::Identity(persist::PersistView persist, const runtime::config::ClientConfig& config)
    : persist_(std::move(persist)),
      computer_title_(config.computer_title()),
      account_name_(config.account_name()),
      registration_key_(config.registration_key()),
      tags_(config.tags().begin(), config.tags().end()) {}

std::string Identity::SecureId() const {
  return persist_.GetString("secure-id");
}

std::string Identity::InsecureId() const {
  return persist_.GetString("insecure-id");
}

void Identity::SetIds(const std::string& secure_id, const std::string& insecure_id) {
  persist_.SetString("secure-id", secure_id);
  if (insecure_id.empty()) {
    persist_.Remove("insecure-id");
  } else {
    persist_.SetString("insecure-id", insecure_id);
  }
  // a lost secure id means a duplicate computer on the server
  persist_.Save();
}

void Identity::Clear() {
  persist_.Remove("secure-id");
  persist_.Remove("insecure-id");
  persist_.Save();
}

} // namespace fleet::registration
