#include "trellis/utils/ErrorHandling.hh"
#include "trellis/core/Log.hh"

namespace trellis {

TrellisException::TrellisException(const std::string &message)
    : message(message) {}

const char *TrellisException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  TRELLIS_LOG_ERROR("TrellisException: {}", message);
  throw TrellisException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::SingularMatrix:
    return "SingularMatrix";
  }
  return "Unknown";
}

} // namespace trellis
