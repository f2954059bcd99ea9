#include "cloudlab/result.h"

namespace cloudlab {

std::string_view error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "success";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::ConfigNotFound:
    return "config_not_found";
  case ErrorCode::ConfigParseError:
    return "config_parse_error";
  case ErrorCode::ShutdownRequested:
    return "shutdown_requested";
  case ErrorCode::SocketError:
    return "socket_error";
  case ErrorCode::AddressInUse:
    return "address_in_use";
  case ErrorCode::CommandTimeout:
    return "timeout";
  case ErrorCode::CommandNotFound:
    return "not_found";
  case ErrorCode::CommandFailed:
    return "error";
  case ErrorCode::Unknown:
    break;
  }
  return "unknown";
}

} // namespace cloudlab
