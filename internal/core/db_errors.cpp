#include "db_errors.hpp"

#include "internal/util/errors.hpp"

namespace flowlog::core {

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
    case db::ErrorCode::InvalidArgument:
      throw util::InvalidArgument(message);
    case db::ErrorCode::Unsupported:
      throw util::NotImplemented(message);
    default:
      throw util::StorageError(message + " (" + db::ToString(result.code) + ")");
  }
}

} // namespace flowlog::core
