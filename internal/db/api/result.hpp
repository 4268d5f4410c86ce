#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace ctxsync::db {

// Backend-neutral outcome of a repository call. SQLite and libpqxx errors are
// mapped onto these codes inside each backend.
enum class ErrorCode {
  OK = 0,

  // Row-level outcomes the version store reacts to.
  NotFound,
  AlreadyExists,
  Conflict,

  // Lock or isolation failures; the same commit may succeed on retry.
  Busy,
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,
  Unsupported,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

// A concurrent writer got there first: a duplicate version row, a moved
// current_version, or a lock/serialization abort.
constexpr bool IsWriteConflict(ErrorCode code) {
  return code == ErrorCode::Conflict || code == ErrorCode::AlreadyExists || code == ErrorCode::Busy ||
         code == ErrorCode::SerializationFailure;
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

  // "<what>: <code> (<message>)" for exception and log text.
  std::string Describe(std::string_view what) const {
    std::string text(what);
    text += ": ";
    text += ToString(code);
    if (!message.empty()) {
      text += " (" + message + ")";
    }
    return text;
  }
};

} // namespace ctxsync::db
