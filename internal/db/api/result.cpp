#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace progress::db {

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace progress::db
