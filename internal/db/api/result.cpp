#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace repricer::db {

const char* ToString(ErrorCode code) {
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
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
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

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + ToString(result.code) : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw repricer::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw repricer::util::NotFound(message);
    case ErrorCode::Conflict:
      throw repricer::util::InvalidState(message);
    default:
      throw repricer::util::StoreUnavailable(message);
  }
}

} // namespace repricer::db
