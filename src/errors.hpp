#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Stable values: codes travel inside ERROR and UPLOAD_DECISION messages.
enum class ErrorCode : std::uint8_t {
  Ok = 0,
  ProtocolError = 1,
  TruncatedMessage = 2,
  SizeLimitExceeded = 3,
  PathSafetyViolation = 4,
  Timeout = 5,
  Cancelled = 6,
  NotFound = 7,
  Rejected = 8,
  ServerBusy = 9,
  ConnectionFailed = 10,
  IoError = 11,
  IntegrityError = 12,
  InvalidArgument = 13,
  InternalError = 14
};

// Generic category text. This is the only error text a server sends to a peer.
const char* describe(ErrorCode code);

// Maps an untrusted wire byte to a known code (InternalError when unknown).
ErrorCode error_code_from_wire(std::uint8_t value);

class LanternError : public std::runtime_error {
public:
  LanternError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

// Malformed or oversized framing; the connection is dropped.
class ProtocolError : public LanternError {
public:
  explicit ProtocolError(const std::string& message)
    : LanternError(ErrorCode::ProtocolError, message) {}
};

// Peer closed the stream in the middle of a message.
class TruncatedMessageError : public LanternError {
public:
  explicit TruncatedMessageError(const std::string& message)
    : LanternError(ErrorCode::TruncatedMessage, message) {}
};

class SizeLimitExceeded : public LanternError {
public:
  explicit SizeLimitExceeded(const std::string& message)
    : LanternError(ErrorCode::SizeLimitExceeded, message) {}
};

class PathSafetyViolation : public LanternError {
public:
  explicit PathSafetyViolation(const std::string& message)
    : LanternError(ErrorCode::PathSafetyViolation, message) {}
};

class TimeoutError : public LanternError {
public:
  explicit TimeoutError(const std::string& message)
    : LanternError(ErrorCode::Timeout, message) {}
};

class ConnectionError : public LanternError {
public:
  ConnectionError(ErrorCode code, const std::string& message)
    : LanternError(code, message) {}
};
