#include "client.hpp"

#include <algorithm>

#include "errors.hpp"
#include "framing.hpp"
#include "log.hpp"
#include "path_safety.hpp"
#include "socket_stream.hpp"
#include "utils.hpp"

namespace {

template<typename Result>
Result failed(Result result, ErrorCode code, const std::string& message) {
  result.code = code;
  result.message = message;
  return result;
}

// Turns an unexpected reply into a result code: ERROR carries the remote
// category, anything else is a protocol violation.
template<typename Result>
Result unexpected_reply(Result result, const Message& reply, MessageType wanted) {
  if(reply.type == MessageType::Error) {
    auto err = parse_error(reply);
    return failed(result, err.code, err.category);
  }
  return failed(result, ErrorCode::ProtocolError,
                std::string("expected ") + message_type_name(wanted) +
                " but received " + message_type_name(reply.type));
}

} // namespace

RequestClient::RequestClient(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("client")) {
  options_.chunk_size = clamp_chunk_size(options_.chunk_size);
}

std::unique_ptr<SocketStream> RequestClient::open(const std::string& host, std::uint16_t port) {
  logger_->debug("connecting to {}", HostPort{host, port}.to_string());
  return SocketStream::connect(host, port, options_.connect_timeout, options_.io_timeout);
}

ListResult RequestClient::list(const std::string& host, std::uint16_t port) {
  ListResult result;
  try {
    auto stream = open(host, port);
    write_message(*stream, make_list_request());
    auto reply = decode_message(*stream);
    if(reply.type != MessageType::ListResponse) {
      return unexpected_reply(result, reply, MessageType::ListResponse);
    }
    auto listing = parse_list_response(reply);
    result.files = std::move(listing.files);
    result.truncated = listing.truncated;
    logger_->debug("{} shares {} file(s)", HostPort{host, port}.to_string(), result.files.size());
  } catch(const LanternError& e) {
    return failed(result, e.code(), e.what());
  } catch(const std::exception& e) {
    return failed(result, ErrorCode::InternalError, e.what());
  }
  return result;
}

TransferResult RequestClient::download(const std::string& host,
                                       std::uint16_t port,
                                       const std::string& filename,
                                       const ProgressCallback& on_progress,
                                       const CancelTokenPtr& cancel) {
  TransferResult result;
  std::filesystem::path destination;
  try {
    destination = resolve_in_directory(options_.download_dir, filename);
  } catch(const PathSafetyViolation& e) {
    return failed(result, e.code(), e.what());
  }
  result.path = destination;
  if(cancel && cancel->cancelled()) {
    return failed(result, ErrorCode::Cancelled, "transfer cancelled");
  }

  std::error_code ec;
  std::filesystem::create_directories(options_.download_dir, ec);
  if(ec) {
    return failed(result, ErrorCode::IoError,
                  "cannot create " + options_.download_dir.string() + ": " + ec.message());
  }

  try {
    auto stream = open(host, port);
    write_message(*stream, make_download_request(destination.filename().string()));
    auto reply = decode_message(*stream);
    if(reply.type != MessageType::DownloadResponse) {
      return unexpected_reply(result, reply, MessageType::DownloadResponse);
    }
    auto size = parse_download_response(reply);
    result.total_bytes = size;
    logger_->info("downloading '{}' ({}) from {}", destination.filename().string(),
                  format_size(size), HostPort{host, port}.to_string());
    return recv_file(*stream, destination, size, on_progress, cancel, logger_.get());
  } catch(const LanternError& e) {
    return failed(result, e.code(), e.what());
  } catch(const std::exception& e) {
    return failed(result, ErrorCode::InternalError, e.what());
  }
}

TransferResult RequestClient::upload(const std::string& host,
                                     std::uint16_t port,
                                     const std::filesystem::path& path,
                                     const ProgressCallback& on_progress,
                                     const CancelTokenPtr& cancel) {
  TransferResult result;
  result.path = path;

  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    return failed(result, ErrorCode::NotFound, path.string() + " is not a regular file");
  }
  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    return failed(result, ErrorCode::IoError, "cannot stat " + path.string() + ": " + ec.message());
  }
  result.total_bytes = size;
  if(size > kMaxTransferBytes) {
    return failed(result, ErrorCode::SizeLimitExceeded,
                  path.filename().string() + " is larger than " + format_size(kMaxTransferBytes));
  }

  std::string name;
  try {
    name = sanitize_filename(path.filename().string());
  } catch(const PathSafetyViolation& e) {
    return failed(result, e.code(), e.what());
  }
  if(cancel && cancel->cancelled()) {
    return failed(result, ErrorCode::Cancelled, "transfer cancelled");
  }

  try {
    auto stream = open(host, port);
    write_message(*stream, make_upload_announce(name, size));

    stream->set_io_timeout(std::max(options_.consent_wait, options_.io_timeout));
    auto reply = decode_message(*stream);
    stream->set_io_timeout(options_.io_timeout);

    if(reply.type != MessageType::UploadDecision) {
      return unexpected_reply(result, reply, MessageType::UploadDecision);
    }
    auto decision = parse_upload_decision(reply);
    if(!decision.accepted) {
      auto reason = decision.reason == ErrorCode::Ok ? ErrorCode::Rejected : decision.reason;
      return failed(result, reason, std::string("upload declined: ") + describe(reason));
    }
    logger_->info("uploading '{}' ({}) to {}", name, format_size(size),
                  HostPort{host, port}.to_string());
    return send_file(*stream, path, options_.chunk_size, on_progress, cancel, logger_.get());
  } catch(const LanternError& e) {
    return failed(result, e.code(), e.what());
  } catch(const std::exception& e) {
    return failed(result, ErrorCode::InternalError, e.what());
  }
}
