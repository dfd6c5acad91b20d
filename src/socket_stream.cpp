#include "socket_stream.hpp"

#include "errors.hpp"

#include <vector>

SocketStream::SocketStream(std::chrono::milliseconds io_timeout)
  : socket_(io_), io_timeout_(io_timeout) {}

SocketStream::~SocketStream() {
  std::error_code ec;
  socket_.close(ec);
}

bool SocketStream::run_for(std::chrono::milliseconds timeout) {
  io_.restart();
  io_.run_for(timeout);
  if(io_.stopped()) return true;

  // Deadline passed with the operation still pending: closing the socket
  // aborts it, then drain the context so the handler never outlives us.
  std::error_code ignored;
  socket_.close(ignored);
  io_.restart();
  io_.run();
  return false;
}

std::unique_ptr<SocketStream> SocketStream::connect(const std::string& host,
                                                    std::uint16_t port,
                                                    std::chrono::milliseconds connect_timeout,
                                                    std::chrono::milliseconds io_timeout) {
  auto stream = std::make_unique<SocketStream>(io_timeout);
  const std::string target = host + ":" + std::to_string(port);
  const auto deadline = std::chrono::steady_clock::now() + connect_timeout;

  std::error_code ec;
  std::vector<tcp::endpoint> endpoints;
  auto address = asio::ip::make_address(host, ec);
  if(!ec) {
    endpoints.emplace_back(address, port);
  } else {
    tcp::resolver resolver(stream->io_);
    std::error_code resolve_ec;
    resolver.async_resolve(host, std::to_string(port),
      [&](const std::error_code& e, tcp::resolver::results_type results){
        resolve_ec = e;
        for(const auto& entry : results) endpoints.push_back(entry.endpoint());
      });
    stream->io_.restart();
    stream->io_.run_for(connect_timeout);
    if(!stream->io_.stopped()) {
      resolver.cancel();
      stream->io_.restart();
      stream->io_.run();
      throw TimeoutError("resolving " + host + " timed out");
    }
    if(resolve_ec || endpoints.empty()) {
      throw ConnectionError(ErrorCode::ConnectionFailed,
                            "cannot resolve " + host + ": " +
                            (resolve_ec ? resolve_ec.message() : std::string("no addresses")));
    }
  }

  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
    deadline - std::chrono::steady_clock::now());
  if(remaining.count() <= 0) {
    throw TimeoutError("connect to " + target + " timed out");
  }

  std::error_code connect_ec;
  asio::async_connect(stream->socket_, endpoints,
    [&](const std::error_code& e, const tcp::endpoint&){
      connect_ec = e;
    });
  if(!stream->run_for(remaining)) {
    throw TimeoutError("connect to " + target + " timed out");
  }
  if(connect_ec) {
    std::error_code ignored;
    stream->socket_.close(ignored);
    throw ConnectionError(ErrorCode::ConnectionFailed,
                          "connect to " + target + " failed: " + connect_ec.message());
  }

  return stream;
}

void SocketStream::read_exact(void* data, std::size_t size) {
  if(size == 0) return;
  std::error_code ec;
  std::size_t transferred = 0;
  asio::async_read(socket_, asio::buffer(data, size),
    [&](const std::error_code& e, std::size_t bytes){
      ec = e;
      transferred = bytes;
    });
  if(!run_for(io_timeout_)) {
    throw TimeoutError("read timed out after " + std::to_string(io_timeout_.count()) + " ms");
  }
  if(ec == asio::error::eof || ec == asio::error::connection_reset) {
    throw TruncatedMessageError("peer closed the connection after " +
                                std::to_string(transferred) + " of " +
                                std::to_string(size) + " bytes");
  }
  if(ec) {
    throw ConnectionError(ErrorCode::IoError, "read failed: " + ec.message());
  }
}

void SocketStream::write_all(const void* data, std::size_t size) {
  if(size == 0) return;
  std::error_code ec;
  asio::async_write(socket_, asio::buffer(data, size),
    [&](const std::error_code& e, std::size_t){
      ec = e;
    });
  if(!run_for(io_timeout_)) {
    throw TimeoutError("write timed out after " + std::to_string(io_timeout_.count()) + " ms");
  }
  if(ec) {
    throw ConnectionError(ErrorCode::IoError, "write failed: " + ec.message());
  }
}

bool SocketStream::input_pending() {
  std::error_code ec;
  auto bytes = socket_.available(ec);
  return !ec && bytes > 0;
}

std::string SocketStream::remote_address() const {
  std::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if(ec) return "unknown";
  return endpoint.address().to_string();
}

void SocketStream::close() {
  std::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

void SocketStream::interrupt() {
  asio::post(io_, [this](){
    std::error_code ec;
    socket_.close(ec);
  });
}
