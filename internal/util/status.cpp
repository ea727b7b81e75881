#include "status.hpp"

#include "internal/util/errors.hpp"

namespace quotecast::util {

std::string_view StatusCodeName(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return "OK";
    case StatusCode::kNotFound:
      return "NOT_FOUND";
    case StatusCode::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case StatusCode::kAlreadyExists:
      return "ALREADY_EXISTS";
    case StatusCode::kConflict:
      return "CONFLICT";
    case StatusCode::kPersistenceFailure:
      return "PERSISTENCE_FAILURE";
    case StatusCode::kInternal:
      return "INTERNAL";
  }
  return "UNKNOWN";
}

std::string Status::ToString() const {
  std::string out(StatusCodeName(code));
  if (!message.empty()) {
    out += ": " + message;
  }
  if (!cause.empty()) {
    out += " (" + cause + ")";
  }
  return out;
}

Status ToStatus(const std::exception& e, std::string_view context) {
  const std::string message = context.empty() ? std::string(e.what()) : std::string(context);
  const std::string cause   = context.empty() ? std::string() : std::string(e.what());

  if (dynamic_cast<const NotFound*>(&e)) {
    return Status::Error(StatusCode::kNotFound, message, cause);
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return Status::Error(StatusCode::kAlreadyExists, message, cause);
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return Status::Error(StatusCode::kInvalidArgument, message, cause);
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return Status::Error(StatusCode::kConflict, message, cause);
  }
  if (dynamic_cast<const PersistenceFailure*>(&e)) {
    return Status::Error(StatusCode::kPersistenceFailure, message, cause);
  }

  return Status::Error(StatusCode::kInternal, message, cause);
}

} // namespace quotecast::util
