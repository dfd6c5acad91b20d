#include "errors.hpp"

const char* describe(ErrorCode code) {
  switch(code) {
    case ErrorCode::Ok: return "ok";
    case ErrorCode::ProtocolError: return "protocol error";
    case ErrorCode::TruncatedMessage: return "connection closed mid-message";
    case ErrorCode::SizeLimitExceeded: return "file exceeds size limit";
    case ErrorCode::PathSafetyViolation: return "invalid filename";
    case ErrorCode::Timeout: return "timed out";
    case ErrorCode::Cancelled: return "cancelled";
    case ErrorCode::NotFound: return "file not found";
    case ErrorCode::Rejected: return "upload declined";
    case ErrorCode::ServerBusy: return "server busy";
    case ErrorCode::ConnectionFailed: return "connection failed";
    case ErrorCode::IoError: return "i/o error";
    case ErrorCode::IntegrityError: return "integrity check failed";
    case ErrorCode::InvalidArgument: return "invalid argument";
    case ErrorCode::InternalError: return "internal error";
  }
  return "internal error";
}

ErrorCode error_code_from_wire(std::uint8_t value) {
  if(value > static_cast<std::uint8_t>(ErrorCode::InternalError)) {
    return ErrorCode::InternalError;
  }
  return static_cast<ErrorCode>(value);
}
