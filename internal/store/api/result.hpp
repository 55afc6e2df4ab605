#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace circulate::store {

/*
  Portable store result codes.

  Backends translate sqlite / pqxx errors into these. Upper layers never see
  backend error types; Raise() maps the transient ones onto
  util::StoreUnavailable so the task queue retries them.
*/

enum class ErrorCode {
  OK = 0,

  Busy,
  Unavailable,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

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

inline bool IsTransient(ErrorCode code) {
  switch (code) {
    case ErrorCode::Busy:
    case ErrorCode::Unavailable:
    case ErrorCode::SerializationFailure:
    case ErrorCode::IOError:
      return true;
    default:
      return false;
  }
}

[[noreturn]] inline void Raise(const Result& result) {
  if (IsTransient(result.code)) throw util::StoreUnavailable(result.message);
  throw std::runtime_error("coordination store: " + result.message);
}

inline void ThrowIfError(const Result& result) {
  if (!result) Raise(result);
}

} // namespace circulate::store
