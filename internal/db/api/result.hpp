#pragma once

#include <string>
#include <string_view>

namespace uploader::db {

/*
  Outcome of a ledger write.

  Backends translate their native errors (sqlite3 result codes, pqxx
  exception types) into these codes. The ledger layer above only looks
  at the code and the message.
*/

enum class ErrorCode {
  OK = 0,

  NotFound, // missing table
  Busy,     // lock not acquired within the busy timeout

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unavailable, // connection refused or lost
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
}

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

} // namespace uploader::db
