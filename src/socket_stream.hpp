#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "byte_stream.hpp"

// TCP stream with per-operation deadlines. Each stream owns a private
// io_context; every blocking call issues the async operation and runs that
// context for at most the configured timeout. A missed deadline closes the
// socket and throws TimeoutError, so no call can block indefinitely.
class SocketStream : public ByteStream {
public:
  using tcp = asio::ip::tcp;

  explicit SocketStream(std::chrono::milliseconds io_timeout);
  ~SocketStream() override;

  SocketStream(const SocketStream&) = delete;
  SocketStream& operator=(const SocketStream&) = delete;

  // Resolves and connects within connect_timeout. On any failure the
  // partially opened socket is closed before the error propagates.
  static std::unique_ptr<SocketStream> connect(const std::string& host,
                                               std::uint16_t port,
                                               std::chrono::milliseconds connect_timeout,
                                               std::chrono::milliseconds io_timeout);

  void read_exact(void* data, std::size_t size) override;
  void write_all(const void* data, std::size_t size) override;
  bool input_pending() override;

  void set_io_timeout(std::chrono::milliseconds timeout) { io_timeout_ = timeout; }
  std::chrono::milliseconds io_timeout() const { return io_timeout_; }

  // Accept target; only touch it before the stream is handed to a worker.
  tcp::socket& socket() { return socket_; }

  std::string remote_address() const;
  bool is_open() const { return socket_.is_open(); }
  void close();

  // Thread-safe: queues a close on the stream's own context so a blocked
  // operation on another thread fails promptly.
  void interrupt();

private:
  // Runs the pending operation; returns false when the deadline passed.
  bool run_for(std::chrono::milliseconds timeout);

  asio::io_context io_;
  tcp::socket socket_;
  std::chrono::milliseconds io_timeout_;
};
