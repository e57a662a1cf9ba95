#include "db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace gemfeed::store {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ConstraintViolation(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message + " (" + db::ToString(result.code) + ")");
  }
}

} // namespace gemfeed::store
