#include "fleet/utils/ErrorHandling.hh"
#include "fleet/core/Log.hh"

namespace fleet {

FleetException::FleetException(const std::string &message)
    : message(message) {}

const char *FleetException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  FLEET_LOG_ERROR("FleetException: {}", message);
  throw FleetException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";
  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::LimitExceeded:
    return "LimitExceeded";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace fleet
