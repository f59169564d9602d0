#include "gatewayd/common/result.hpp"

namespace gatewayd::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "OK";
  case ErrorCode::AuthRejected:
    return "AUTH_REJECTED";
  case ErrorCode::Validation:
    return "VALIDATION_ERROR";
  case ErrorCode::MethodNotFound:
    return "METHOD_NOT_FOUND";
  case ErrorCode::UnknownCommand:
    return "UNKNOWN_COMMAND";
  case ErrorCode::HandlerError:
    return "HANDLER_ERROR";
  case ErrorCode::PortConflict:
    return "PORT_CONFLICT";
  case ErrorCode::ProcessNotResponding:
    return "PROCESS_NOT_RESPONDING";
  case ErrorCode::Io:
    return "IO_ERROR";
  case ErrorCode::NotFound:
    return "NOT_FOUND";
  case ErrorCode::Internal:
    return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

} // namespace gatewayd::common
