#pragma once

#include <string>
#include <utility>

namespace shopstack::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
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

  std::string Describe() const {
    return message.empty() ? std::string(ToString(code)) : std::string(ToString(code)) + ": " + message;
  }
};

} // namespace shopstack::db
