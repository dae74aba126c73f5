#pragma once

#include <stdexcept>
#include <string>

namespace fleet::util {

/*
  Central error types.

  Transport failures are recovered inside the exchange loop; the rest are
  surfaced to the caller and the log.
*/

// Message type is not in the server's accepted set.
class TypeRejected : public std::runtime_error {
 public:
  explicit TypeRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Network or transport error; retried with backoff.
class TransmissionFailure : public std::runtime_error {
 public:
  explicit TransmissionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The server answered but the answer could not be used.
class MalformedResponse : public TransmissionFailure {
 public:
  explicit MalformedResponse(const std::string& msg) : TransmissionFailure(msg) {
  }
};

// The server no longer recognises our secure id.
class IdentityRejected : public std::runtime_error {
 public:
  explicit IdentityRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Registration refused (unknown account, bad key). Never retried automatically.
class RegistrationError : public std::runtime_error {
 public:
  explicit RegistrationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Repository failure while reading or writing the local queue.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fleet::util
