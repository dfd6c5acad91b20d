#include "transfer_engine.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <vector>

#include "framing.hpp"
#include "log.hpp"
#include "path_safety.hpp"
#include "utils.hpp"

namespace {

// Removes the staging file unless commit() moved it into place. Each instance
// creates its own file exclusively, so two receives of the same name never
// share a staging file.
class StagingFile {
public:
  explicit StagingFile(std::filesystem::path destination) : destination_(std::move(destination)) {}

  ~StagingFile() {
    if(out_.is_open()) out_.close();
    if(created_ && !committed_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }

  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;

  // Returns false with `error` set when no staging file could be created.
  bool open(std::string& error) {
    for(int attempt = 0; attempt < 8; ++attempt) {
      path_ = staging_path_for(destination_, random_instance_id());
      int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
      if(fd < 0) {
        if(errno == EEXIST) continue;
        error = "cannot create " + path_.string() + ": " + std::strerror(errno);
        return false;
      }
      ::close(fd);
      created_ = true;
      out_.open(path_, std::ios::binary | std::ios::trunc);
      if(!out_.is_open()) {
        error = "cannot open " + path_.string() + " for writing";
        return false;
      }
      return true;
    }
    error = "no free staging name beside " + destination_.string();
    return false;
  }

  void write(const std::uint8_t* data, std::size_t size) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if(!out_) {
      throw LanternError(ErrorCode::IoError, "write to " + path_.string() + " failed");
    }
  }

  void commit() {
    out_.close();
    if(out_.fail()) {
      throw LanternError(ErrorCode::IoError, "flushing " + path_.string() + " failed");
    }
    std::error_code ec;
    std::filesystem::rename(path_, destination_, ec);
    if(ec) {
      throw LanternError(ErrorCode::IoError,
                         "moving " + path_.string() + " into place failed: " + ec.message());
    }
    committed_ = true;
  }

private:
  std::filesystem::path destination_;
  std::filesystem::path path_;
  std::ofstream out_;
  bool created_ = false;
  bool committed_ = false;
};

// Best effort: the peer may already be gone.
void try_write(ByteStream& stream, const Message& message, Logger* logger) {
  try {
    write_message(stream, message);
  } catch(const std::exception& e) {
    log_debug(logger, "could not send {}: {}", message_type_name(message.type), e.what());
  }
}

TransferResult failure(TransferResult result, ErrorCode code, const std::string& message) {
  result.code = code;
  result.message = message;
  return result;
}

// A receiver that gives up mid-stream says so before it closes. Reads that
// reply, if one is waiting, so the sender reports the receiver's outcome
// instead of a failed write.
std::optional<TransferResult> receiver_stopped(ByteStream& stream, const TransferResult& result) {
  if(!stream.input_pending()) return std::nullopt;
  try {
    auto reply = decode_message(stream);
    switch(reply.type) {
      case MessageType::TransferCancel:
        return failure(result, ErrorCode::Cancelled, "receiver cancelled the transfer");
      case MessageType::Error: {
        auto err = parse_error(reply);
        return failure(result, err.code, "receiver reported: " + err.category);
      }
      default:
        return failure(result, ErrorCode::ProtocolError,
                       std::string("unexpected ") + message_type_name(reply.type) + " during transfer");
    }
  } catch(const LanternError& e) {
    return failure(result, e.code(), e.what());
  }
}

} // namespace

std::size_t clamp_chunk_size(std::size_t requested) {
  if(requested == 0) return kDefaultChunkSize;
  if(requested > kMaxChunkSize) return kMaxChunkSize;
  return requested;
}

TransferResult send_file(ByteStream& stream,
                         const std::filesystem::path& path,
                         std::size_t chunk_size,
                         const ProgressCallback& on_progress,
                         const CancelTokenPtr& cancel,
                         Logger* logger) {
  TransferSession session;
  session.cancel = cancel;
  session.destination_path = path;

  TransferResult result;
  result.path = path;

  std::ifstream in(path, std::ios::binary);
  if(!in) {
    return failure(result, ErrorCode::IoError, "cannot open " + path.string());
  }
  std::error_code size_ec;
  session.total_bytes = std::filesystem::file_size(path, size_ec);
  if(size_ec) {
    return failure(result, ErrorCode::IoError, "cannot stat " + path.string() + ": " + size_ec.message());
  }
  result.total_bytes = session.total_bytes;

  chunk_size = clamp_chunk_size(chunk_size);
  std::vector<std::uint8_t> buffer(chunk_size);
  Sha256 digest;

  try {
    while(session.bytes_moved < session.total_bytes) {
      if(session.cancel_requested()) {
        try_write(stream, make_transfer_cancel(), logger);
        result.bytes_moved = session.bytes_moved;
        return failure(result, ErrorCode::Cancelled, "transfer cancelled");
      }
      auto want = static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk_size, session.total_bytes - session.bytes_moved));
      in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
      auto got = static_cast<std::size_t>(in.gcount());
      if(got != want) {
        try_write(stream, make_transfer_cancel(), logger);
        result.bytes_moved = session.bytes_moved;
        return failure(result, ErrorCode::IoError, "short read from " + path.string());
      }
      if(auto stopped = receiver_stopped(stream, result)) return *stopped;
      try {
        write_message(stream, make_file_chunk(buffer.data(), got), chunk_size);
      } catch(const LanternError&) {
        if(auto stopped = receiver_stopped(stream, result)) return *stopped;
        throw;
      }
      digest.update(buffer.data(), got);
      session.bytes_moved += got;
      result.bytes_moved = session.bytes_moved;
      if(on_progress) on_progress(session.bytes_moved, session.total_bytes);
    }
    if(session.cancel_requested()) {
      try_write(stream, make_transfer_cancel(), logger);
      return failure(result, ErrorCode::Cancelled, "transfer cancelled");
    }

    write_message(stream, make_file_end(digest.final_hex()));

    auto reply = decode_message(stream);
    switch(reply.type) {
      case MessageType::Ack: {
        auto acknowledged = parse_ack(reply);
        if(acknowledged != session.bytes_moved) {
          return failure(result, ErrorCode::ProtocolError,
                         "receiver acknowledged " + std::to_string(acknowledged) +
                         " of " + std::to_string(session.bytes_moved) + " bytes");
        }
        break;
      }
      case MessageType::TransferCancel:
        return failure(result, ErrorCode::Cancelled, "receiver cancelled the transfer");
      case MessageType::Error: {
        auto err = parse_error(reply);
        return failure(result, err.code, "receiver reported: " + err.category);
      }
      default:
        return failure(result, ErrorCode::ProtocolError,
                       std::string("unexpected ") + message_type_name(reply.type) + " after FILE_END");
    }
  } catch(const LanternError& e) {
    return failure(result, e.code(), e.what());
  } catch(const std::exception& e) {
    return failure(result, ErrorCode::InternalError, e.what());
  }

  log_debug(logger, "sent {} ({})", path.filename().string(), format_size(session.bytes_moved));
  return result;
}

TransferResult recv_file(ByteStream& stream,
                         const std::filesystem::path& destination,
                         std::uint64_t expected_size,
                         const ProgressCallback& on_progress,
                         const CancelTokenPtr& cancel,
                         Logger* logger,
                         std::size_t chunk_limit) {
  TransferSession session;
  session.total_bytes = expected_size;
  session.cancel = cancel;
  session.destination_path = destination;

  TransferResult result;
  result.path = destination;
  result.total_bytes = expected_size;

  if(expected_size > kMaxTransferBytes) {
    return failure(result, ErrorCode::SizeLimitExceeded,
                   "announced size " + std::to_string(expected_size) + " exceeds the " +
                   format_size(kMaxTransferBytes) + " limit");
  }

  StagingFile staging(destination);
  std::string staging_error;
  if(!staging.open(staging_error)) {
    return failure(result, ErrorCode::IoError, staging_error);
  }

  Sha256 digest;
  try {
    for(;;) {
      if(session.cancel_requested()) {
        try_write(stream, make_transfer_cancel(), logger);
        result.bytes_moved = session.bytes_moved;
        return failure(result, ErrorCode::Cancelled, "transfer cancelled");
      }

      auto message = decode_message(stream, chunk_limit);
      switch(message.type) {
        case MessageType::FileChunk: {
          const auto size = message.payload.size();
          if(session.bytes_moved + size > session.total_bytes) {
            throw ProtocolError("sender exceeded the announced size of " +
                                std::to_string(session.total_bytes) + " bytes");
          }
          staging.write(message.payload.data(), size);
          digest.update(message.payload.data(), size);
          session.bytes_moved += size;
          result.bytes_moved = session.bytes_moved;
          if(on_progress) on_progress(session.bytes_moved, session.total_bytes);
          break;
        }
        case MessageType::FileEnd: {
          if(session.bytes_moved != session.total_bytes) {
            throw ProtocolError("stream ended after " + std::to_string(session.bytes_moved) +
                                " of " + std::to_string(session.total_bytes) + " bytes");
          }
          auto expected_digest = parse_file_end(message);
          auto actual_digest = digest.final_hex();
          if(to_lower_copy(expected_digest) != actual_digest) {
            try_write(stream, make_error(ErrorCode::IntegrityError), logger);
            return failure(result, ErrorCode::IntegrityError, "SHA-256 mismatch");
          }
          staging.commit();
          // The verified file stays in place even when the ACK is lost.
          try {
            write_message(stream, make_ack(session.bytes_moved));
          } catch(const LanternError& e) {
            log_warn(logger, "stored {} but the ACK was not delivered: {}",
                     destination.filename().string(), e.what());
            result.message = std::string("ACK not delivered: ") + e.what();
            return result;
          }
          log_debug(logger, "received {} ({})", destination.filename().string(),
                    format_size(session.bytes_moved));
          return result;
        }
        case MessageType::TransferCancel:
          return failure(result, ErrorCode::Cancelled, "sender cancelled the transfer");
        case MessageType::Error: {
          auto err = parse_error(message);
          return failure(result, err.code, "sender reported: " + err.category);
        }
        default:
          throw ProtocolError(std::string("unexpected ") + message_type_name(message.type) +
                              " during transfer");
      }
    }
  } catch(const ProtocolError& e) {
    try_write(stream, make_error(ErrorCode::ProtocolError), logger);
    return failure(result, ErrorCode::ProtocolError, e.what());
  } catch(const LanternError& e) {
    return failure(result, e.code(), e.what());
  } catch(const std::exception& e) {
    return failure(result, ErrorCode::InternalError, e.what());
  }
}
