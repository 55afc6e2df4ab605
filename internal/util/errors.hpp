#pragma once

#include <stdexcept>
#include <string>

namespace circulate::util {

/*
  Central error types.

  TransientError and its subclasses are the only failures the task queue
  retries. Everything else ends the task on the first attempt.
*/

class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public TransientError {
 public:
  explicit StoreUnavailable(const std::string& msg) : TransientError(msg) {
  }
};

class ObjectStoreError : public TransientError {
 public:
  explicit ObjectStoreError(const std::string& msg) : TransientError(msg) {
  }
};

class LockTimeout : public TransientError {
 public:
  explicit LockTimeout(const std::string& msg) : TransientError(msg) {
  }
};

// A single record cannot be processed. Recorded and skipped.
class PermanentError : public std::runtime_error {
 public:
  explicit PermanentError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockError : public std::runtime_error {
 public:
  explicit LockError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Upload session invariant violated. kUpdateNumberMismatch and
  kConcurrentModification mean another invocation moved the session on;
  callers treat those as supersession rather than failure.
*/
class UploadSessionError : public std::runtime_error {
 public:
  enum class Reason {
    kNotLocked,
    kUpdateNumberMismatch,
    kConcurrentModification,
    kNotInitialized,
    kUploadIdConflict,
    kPartOutOfOrder,
    kCorrupt,
  };

  UploadSessionError(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const {
    return reason_;
  }

  bool Superseded() const {
    return reason_ == Reason::kUpdateNumberMismatch || reason_ == Reason::kConcurrentModification;
  }

 private:
  Reason reason_;
};

} // namespace circulate::util
