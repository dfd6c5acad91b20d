#include "server.hpp"

#include "errors.hpp"
#include "framing.hpp"
#include "log.hpp"
#include "path_safety.hpp"
#include "socket_stream.hpp"
#include "utils.hpp"

struct FileServer::Session {
  std::shared_ptr<SocketStream> stream;
  std::string peer;
  State state = State::AwaitRequest;
  Message request;
  Message reply;
  State after_reply = State::Closed;
  std::string filename;
  std::filesystem::path file;
  std::uint64_t size = 0;
  bool incoming = false;
  UploadConsentRequestPtr consent;
};

const char* server_state_name(FileServer::State state) {
  switch(state) {
    case FileServer::State::AwaitRequest: return "await-request";
    case FileServer::State::Dispatch: return "dispatch";
    case FileServer::State::Respond: return "respond";
    case FileServer::State::AwaitConsent: return "await-consent";
    case FileServer::State::StreamData: return "stream-data";
    case FileServer::State::Closed: return "closed";
  }
  return "unknown";
}

FileServer::FileServer(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("server")),
    index_(options_.shared_dir.empty() ? default_shared_dir() : options_.shared_dir),
    slots_(options_.max_connections > 0 ? options_.max_connections : 1),
    consent_(options_.consent_timeout) {
  options_.chunk_size = clamp_chunk_size(options_.chunk_size);
}

FileServer::~FileServer() {
  stop();
}

void FileServer::start() {
  if(running_) return;

  std::string error;
  if(!index_.ensure_root(error)) {
    throw LanternError(ErrorCode::IoError, error);
  }

  std::error_code ec;
  auto address = asio::ip::make_address(options_.bind_ip, ec);
  if(ec) {
    throw LanternError(ErrorCode::InvalidArgument, "invalid bind address '" + options_.bind_ip + "'");
  }

  acceptor_ = std::make_unique<tcp::acceptor>(accept_io_);
  tcp::endpoint endpoint(address, options_.port);
  acceptor_->open(endpoint.protocol(), ec);
  if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_->bind(endpoint, ec);
  if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    std::error_code ignored;
    acceptor_->close(ignored);
    acceptor_.reset();
    throw LanternError(ErrorCode::IoError,
                       "cannot listen on " + options_.bind_ip + ":" +
                       std::to_string(options_.port) + ": " + ec.message());
  }
  port_ = acceptor_->local_endpoint(ec).port();

  shutdown_ = std::make_shared<CancelToken>();
  workers_ = std::make_unique<asio::thread_pool>(slots_.capacity());
  running_ = true;
  accept_io_.restart();
  start_accept();
  accept_thread_ = std::thread([this](){ accept_io_.run(); });

  logger_->info("serving {} on TCP {} (max {} connections)",
                index_.root().string(), port_, slots_.capacity());
}

void FileServer::stop() {
  if(!running_.exchange(false)) return;

  asio::post(accept_io_, [this](){
    std::error_code ec;
    if(acceptor_) acceptor_->close(ec);
  });
  if(accept_thread_.joinable()) accept_thread_.join();
  accept_io_.stop();

  if(shutdown_) shutdown_->request_cancel();
  consent_.reject_all();
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for(const auto& stream : streams_) stream->interrupt();
  }
  if(workers_) {
    workers_->join();
    workers_.reset();
  }
  acceptor_.reset();
  logger_->info("file server stopped");
}

void FileServer::start_accept() {
  auto stream = std::make_shared<SocketStream>(options_.io_timeout);
  acceptor_->async_accept(stream->socket(), [this, stream](const std::error_code& ec){
    if(ec) {
      if(ec == asio::error::operation_aborted || !running_) return;
      logger_->warn("accept failed: {}", ec.message());
    } else if(!running_) {
      stream->close();
      return;
    } else if(auto slot = slots_.try_acquire()) {
      {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.insert(stream);
      }
      asio::post(*workers_, [this, stream, ticket = std::move(*slot)]() mutable {
        serve(stream, std::move(ticket));
      });
    } else {
      refuse(stream);
    }
    if(running_) start_accept();
  });
}

void FileServer::refuse(const std::shared_ptr<SocketStream>& stream) {
  ++refused_;
  logger_->warn("refusing connection from {}: all {} slots in use",
                stream->remote_address(), slots_.capacity());
  stream->set_io_timeout(std::chrono::milliseconds(250));
  try {
    write_message(*stream, make_error(ErrorCode::ServerBusy));
  } catch(const std::exception& e) {
    logger_->debug("could not tell {} the server is busy: {}", stream->remote_address(), e.what());
  }
  stream->close();
}

void FileServer::serve(std::shared_ptr<SocketStream> stream, ConnectionSlot slot) {
  Session session;
  session.stream = stream;
  session.peer = stream->remote_address();
  logger_->debug("connection from {} ({} of {} slots)", session.peer,
                 slots_.in_use(), slots_.capacity());

  while(session.state != State::Closed) {
    step(session);
  }

  stream->close();
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_.erase(stream);
  }
  slot.release();
}

void FileServer::step(Session& session) {
  auto send_error = [&](ErrorCode code){
    try {
      write_message(*session.stream, make_error(code));
    } catch(const std::exception& e) {
      logger_->debug("could not send error to {}: {}", session.peer, e.what());
    }
  };

  try {
    switch(session.state) {
      case State::AwaitRequest: await_request(session); break;
      case State::Dispatch: dispatch(session); break;
      case State::Respond: respond(session); break;
      case State::AwaitConsent: await_consent(session); break;
      case State::StreamData: stream_data(session); break;
      case State::Closed: break;
    }
  } catch(const TruncatedMessageError& e) {
    logger_->debug("{} disconnected in {}: {}", session.peer, server_state_name(session.state), e.what());
    session.state = State::Closed;
  } catch(const TimeoutError& e) {
    logger_->info("{} timed out in {}: {}", session.peer, server_state_name(session.state), e.what());
    session.state = State::Closed;
  } catch(const ConnectionError& e) {
    logger_->debug("connection to {} failed in {}: {}", session.peer, server_state_name(session.state), e.what());
    session.state = State::Closed;
  } catch(const LanternError& e) {
    logger_->warn("dropping {} in {}: {}", session.peer, server_state_name(session.state), e.what());
    send_error(e.code());
    session.state = State::Closed;
  } catch(const std::exception& e) {
    logger_->error("internal error serving {}: {}", session.peer, e.what());
    send_error(ErrorCode::InternalError);
    session.state = State::Closed;
  }
}

void FileServer::await_request(Session& session) {
  session.request = decode_message(*session.stream);
  session.state = State::Dispatch;
}

void FileServer::dispatch(Session& session) {
  auto reply_then_close = [&](Message reply){
    session.reply = std::move(reply);
    session.after_reply = State::Closed;
    session.state = State::Respond;
  };

  switch(session.request.type) {
    case MessageType::ListRequest: {
      std::vector<RemoteFile> files;
      for(const auto& entry : index_.list()) {
        files.push_back(RemoteFile{entry.name, entry.size});
      }
      logger_->debug("{} listed {} file(s)", session.peer, files.size());
      reply_then_close(make_list_response(files));
      return;
    }

    case MessageType::DownloadRequest: {
      auto requested = parse_download_request(session.request);
      std::optional<FileEntry> entry;
      try {
        entry = index_.find(requested);
      } catch(const PathSafetyViolation& e) {
        logger_->warn("{} requested an unsafe name: {}", session.peer, e.what());
        reply_then_close(make_error(ErrorCode::PathSafetyViolation));
        return;
      }
      if(!entry) {
        reply_then_close(make_error(ErrorCode::NotFound));
        return;
      }
      if(entry->size > kMaxTransferBytes) {
        reply_then_close(make_error(ErrorCode::SizeLimitExceeded));
        return;
      }
      session.filename = entry->name;
      session.file = index_.root() / entry->name;
      session.size = entry->size;
      session.incoming = false;
      session.reply = make_download_response(entry->size);
      session.after_reply = State::StreamData;
      session.state = State::Respond;
      return;
    }

    case MessageType::UploadAnnounce: {
      auto announce = parse_upload_announce(session.request);
      std::filesystem::path destination;
      try {
        destination = index_.destination_for(announce.filename);
      } catch(const PathSafetyViolation& e) {
        logger_->warn("{} announced an unsafe name: {}", session.peer, e.what());
        reply_then_close(make_upload_decision(false, ErrorCode::PathSafetyViolation));
        return;
      }
      if(announce.size > kMaxTransferBytes) {
        logger_->warn("{} announced {} bytes for '{}', over the limit", session.peer,
                      announce.size, destination.filename().string());
        reply_then_close(make_upload_decision(false, ErrorCode::SizeLimitExceeded));
        return;
      }
      session.filename = destination.filename().string();
      session.file = destination;
      session.size = announce.size;
      session.incoming = true;
      session.consent = consent_.open(session.filename, session.size, session.peer);
      logger_->info("upload request #{}: '{}' ({}) from {}", session.consent->id(),
                    session.filename, format_size(session.size), session.peer);
      session.state = State::AwaitConsent;
      return;
    }

    default:
      throw ProtocolError(std::string(message_type_name(session.request.type)) +
                          " is not a request");
  }
}

void FileServer::respond(Session& session) {
  write_message(*session.stream, session.reply);
  session.state = session.after_reply;
}

void FileServer::await_consent(Session& session) {
  auto decision = session.consent->wait();
  consent_.close(session.consent->id());
  logger_->info("upload request #{} {}", session.consent->id(), consent_decision_name(decision));

  if(decision == ConsentDecision::Accepted && running_) {
    session.reply = make_upload_decision(true, ErrorCode::Ok);
    session.after_reply = State::StreamData;
  } else {
    session.reply = make_upload_decision(false, ErrorCode::Rejected);
    session.after_reply = State::Closed;
  }
  session.state = State::Respond;
}

void FileServer::stream_data(Session& session) {
  const bool large = session.size >= options_.large_transfer_bytes;
  TransferEvent event;
  event.filename = session.filename;
  event.peer = session.peer;
  event.incoming = session.incoming;
  event.total_bytes = session.size;

  ProgressCallback progress;
  if(large) {
    progress = [this, event](std::uint64_t moved, std::uint64_t total) mutable {
      event.bytes_moved = moved;
      event.total_bytes = total;
      notify(event);
    };
  }

  TransferResult result = session.incoming
    ? recv_file(*session.stream, session.file, session.size, progress, shutdown_, logger_.get())
    : send_file(*session.stream, session.file, options_.chunk_size, progress, shutdown_, logger_.get());

  if(result.ok()) {
    logger_->info("{} '{}' ({}) {} {}", session.incoming ? "received" : "sent",
                  session.filename, format_size(result.bytes_moved),
                  session.incoming ? "from" : "to", session.peer);
  } else {
    logger_->warn("{} '{}' {} {} failed: {} ({})", session.incoming ? "receiving" : "sending",
                  session.filename, session.incoming ? "from" : "to", session.peer,
                  describe(result.code), result.message);
  }

  event.bytes_moved = result.bytes_moved;
  event.finished = true;
  event.code = result.code;
  notify(event);
  session.state = State::Closed;
}

void FileServer::notify(const TransferEvent& event) {
  TransferObserver observer;
  {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer = observer_;
  }
  if(observer) observer(event);
}

void FileServer::set_upload_consent_handler(UploadConsentBroker::Handler handler) {
  consent_.set_handler(std::move(handler));
}

void FileServer::set_transfer_observer(TransferObserver observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
}

std::vector<UploadConsentRequestPtr> FileServer::pending_uploads() const {
  return consent_.pending();
}

bool FileServer::resolve_upload(std::uint64_t id, bool accept) {
  return consent_.resolve(id, accept);
}
