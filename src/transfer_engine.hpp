#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "byte_stream.hpp"
#include "errors.hpp"
#include "protocol.hpp"

class Logger;

// Shared between the transferring task and whoever may cancel it.
class CancelToken {
public:
  void request_cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

// Invoked after every chunk on the transferring thread, in order.
using ProgressCallback = std::function<void(std::uint64_t bytes_moved, std::uint64_t total_bytes)>;

struct TransferSession {
  std::uint64_t total_bytes = 0;
  std::uint64_t bytes_moved = 0;
  CancelTokenPtr cancel;
  std::filesystem::path destination_path;

  bool cancel_requested() const { return cancel && cancel->cancelled(); }
};

struct TransferResult {
  ErrorCode code = ErrorCode::Ok;
  std::uint64_t bytes_moved = 0;
  std::uint64_t total_bytes = 0;
  std::string message;         // local detail, never sent to a peer
  std::filesystem::path path;  // file written or read

  bool ok() const { return code == ErrorCode::Ok; }
  bool cancelled() const { return code == ErrorCode::Cancelled; }
};

// Streams `path` as FILE_CHUNK frames of at most `chunk_size` bytes followed
// by FILE_END{sha256}, then waits for the receiver's ACK. The file size at
// open time is the progress total; the caller has already announced it.
// Cancellation is polled before every chunk and sends TRANSFER_CANCEL.
TransferResult send_file(ByteStream& stream,
                         const std::filesystem::path& path,
                         std::size_t chunk_size,
                         const ProgressCallback& on_progress,
                         const CancelTokenPtr& cancel,
                         Logger* logger = nullptr);

// Receives exactly `expected_size` bytes into a staging file beside
// `destination`, verifies the digest from FILE_END, renames the staging file
// over `destination` and replies ACK. Every failure path (size cap,
// cancellation, protocol violation, digest mismatch, I/O error, lost
// connection) removes the staging file; nothing is written at all when
// `expected_size` exceeds kMaxTransferBytes.
TransferResult recv_file(ByteStream& stream,
                         const std::filesystem::path& destination,
                         std::uint64_t expected_size,
                         const ProgressCallback& on_progress,
                         const CancelTokenPtr& cancel,
                         Logger* logger = nullptr,
                         std::size_t chunk_limit = kMaxChunkSize);

std::size_t clamp_chunk_size(std::size_t requested);
