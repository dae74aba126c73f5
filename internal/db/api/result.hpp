#pragma once

#include <string>

namespace fleet::db {

/*
  Backend-neutral outcome of a repository write.

  Repositories translate sqlite codes into these; MessageStore and
  ExchangeStore turn anything but OK into util::StorageError.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  // sequence number already queued
  AlreadyExists,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// "<what>: <code name>: <message>"
std::string Describe(const Result& result, const char* what);

} // namespace fleet::db
