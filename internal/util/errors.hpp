#pragma once

#include <stdexcept>
#include <string>

namespace ctxsync::util {

/*
  Central error types.

  Callers of ContextManager only ever see ValidationError, NotFoundError,
  ConflictCommitError or Cancelled. The sync failures stay inside the engine
  and are logged and counted.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConflictCommitError : public std::runtime_error {
 public:
  explicit ConflictCommitError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SyncPartialFailure : public std::runtime_error {
 public:
  explicit SyncPartialFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SyncFatalFailure : public std::runtime_error {
 public:
  explicit SyncFatalFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ctxsync::util
