#include "brickforge/utils/ErrorHandling.hh"
#include "brickforge/core/Log.hh"

namespace brickforge {

BrickforgeException::BrickforgeException(const std::string &message)
    : message(message) {}

const char *BrickforgeException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  BRICKFORGE_LOG_ERROR("BrickforgeException: {}", message);
  throw BrickforgeException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";
  case ErrorCode::MissingDependency:
    return "MissingDependency";
  case ErrorCode::DependencyCycle:
    return "DependencyCycle";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::ExecutionFailed:
    return "ExecutionFailed";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace brickforge
