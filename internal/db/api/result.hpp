#pragma once

#include <string>
#include <string_view>

namespace walship::db {

/*
  Outcome of a repository write. Backends translate their native error codes
  into ErrorCode; nothing above internal/db sees a sqlite3 return value.
*/

enum class ErrorCode {
  OK = 0,

  // frame txid already recorded for this database
  AlreadyExists,
  // lock contention outlasted the busy timeout
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
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

} // namespace walship::db
