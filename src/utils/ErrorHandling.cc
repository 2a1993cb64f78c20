#include "stride/utils/ErrorHandling.hh"
#include "stride/core/Log.hh"

namespace stride {

StrideException::StrideException(const std::string &message)
    : message(message) {}

const char *StrideException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  STRIDE_LOG_ERROR("StrideException: {}", message);
  throw StrideException(message);
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
  case ErrorCode::TypeMismatch:
    return "TypeMismatch";
  case ErrorCode::MissingDependency:
    return "MissingDependency";
  case ErrorCode::Unsupported:
    return "Unsupported";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace stride
