#pragma once

#include <string>

namespace repricer::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.

  Lock and cooldown protocols rely on two of them:
    AlreadyExists  unique key taken (create-or-fail lost)
    Conflict       conditional update matched no row (reclaim lost)
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
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

const char* ToString(ErrorCode code);

// Converts a failed Result into the matching util exception.
// AlreadyExists/NotFound keep their meaning, Conflict becomes InvalidState,
// everything else is StoreUnavailable.
void ThrowIfError(const Result& result, const std::string& context);

} // namespace repricer::db
