#include "internal/util/errors.hpp"

namespace rowqueue::util {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw NotFound(message);
    default:
      throw StoreError(result.code, message + " (" + db::ToString(result.code) + ")");
  }
}

std::string Describe(const std::exception_ptr& error) {
  if (!error) return "unknown error";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace rowqueue::util
