#pragma once

#include <cstddef>

// Blocking byte transport under the framing codec. Implementations enforce
// their own deadlines and throw LanternError subclasses:
// TruncatedMessageError when the peer closes before `size` bytes arrive,
// TimeoutError when a deadline passes, ConnectionError for other failures.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual void read_exact(void* data, std::size_t size) = 0;
  virtual void write_all(const void* data, std::size_t size) = 0;

  // True when bytes can be read without blocking.
  virtual bool input_pending() { return false; }
};
