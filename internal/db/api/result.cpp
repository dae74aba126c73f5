#include "result.hpp"

namespace fleet::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "I/O error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

std::string Describe(const Result& result, const char* what) {
  std::string out = std::string(what) + ": " + ErrorCodeName(result.code);
  if (!result.message.empty()) out += ": " + result.message;
  return out;
}

} // namespace fleet::db
