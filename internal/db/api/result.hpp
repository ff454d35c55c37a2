#pragma once

#include <string>
#include <utility>

namespace jwlmerge::db {

/*
  Portable store result codes.

  The sqlite layer translates backend (extended) result codes into these.
  Merge logic never inspects sqlite3 error codes directly.
*/

enum class ErrorCode {
  OK = 0,

  // UNIQUE / PRIMARY KEY conflict. Recoverable during a merge.
  Duplicate,
  // NOT NULL, CHECK, FOREIGN KEY and other constraint failures.
  ConstraintViolation,

  Busy,
  ReadOnly,
  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Duplicate:
      return "duplicate";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ReadOnly:
      return "read only";
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

} // namespace jwlmerge::db
