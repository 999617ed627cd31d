#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace saga::db {

/*
  Outcome of a single execution-store write.

  Backends map their native failures (sqlite3 result codes, pqxx exception
  types) onto ErrorCode so the orchestrator can tell a lost version race
  (Conflict) from a missing row (NotFound) without knowing the backend.
*/

enum class ErrorCode {
  OK = 0,

  // row-level outcomes the orchestrator reacts to
  NotFound,
  AlreadyExists,
  Conflict,

  // backend could not take the write right now
  Busy,
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Conflict: return "version conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::SerializationFailure: return "serialization failure";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace saga::db
