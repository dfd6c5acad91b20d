#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "connection_slots.hpp"
#include "file_index.hpp"
#include "protocol.hpp"
#include "transfer_engine.hpp"
#include "upload_consent.hpp"

class Logger;
class SocketStream;

// Serves LIST, DOWNLOAD and consented UPLOAD requests from the shared
// directory. Every accepted connection needs a slot from a bounded pool; when
// none is free the connection gets ERROR{ServerBusy} and is closed. Each
// admitted connection runs one request through a small state machine on the
// worker pool and is then closed.
class FileServer {
public:
  struct Options {
    std::string bind_ip = "0.0.0.0";
    std::uint16_t port = 5000;               // 0 picks an ephemeral port
    std::filesystem::path shared_dir;
    std::size_t max_connections = 50;
    std::size_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds io_timeout{30000};
    std::chrono::milliseconds consent_timeout{60000};
    std::uint64_t large_transfer_bytes = 1024 * 1024;
  };

  enum class State { AwaitRequest, Dispatch, Respond, AwaitConsent, StreamData, Closed };

  struct TransferEvent {
    std::string filename;
    std::string peer;
    bool incoming = false;
    std::uint64_t bytes_moved = 0;
    std::uint64_t total_bytes = 0;
    bool finished = false;
    ErrorCode code = ErrorCode::Ok;
  };
  // Progress of large transfers plus one finished event per transfer.
  using TransferObserver = std::function<void(const TransferEvent&)>;

  explicit FileServer(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~FileServer();

  FileServer(const FileServer&) = delete;
  FileServer& operator=(const FileServer&) = delete;

  // Binds and listens, then accepts on a background thread. On failure the
  // acceptor is closed and LanternError(IoError) is thrown.
  void start();
  // Stops accepting, rejects pending consents, interrupts connections and
  // waits for the workers.
  void stop();
  bool running() const { return running_.load(); }

  std::uint16_t port() const { return port_; }
  std::size_t active_connections() const { return slots_.in_use(); }
  std::size_t refused_connections() const { return refused_.load(); }

  void set_upload_consent_handler(UploadConsentBroker::Handler handler);
  void set_transfer_observer(TransferObserver observer);
  std::vector<UploadConsentRequestPtr> pending_uploads() const;
  bool resolve_upload(std::uint64_t id, bool accept);

  const FileIndex& index() const { return index_; }

private:
  using tcp = asio::ip::tcp;
  struct Session;

  void start_accept();
  void refuse(const std::shared_ptr<SocketStream>& stream);
  void serve(std::shared_ptr<SocketStream> stream, ConnectionSlot slot);
  void step(Session& session);

  void await_request(Session& session);
  void dispatch(Session& session);
  void respond(Session& session);
  void await_consent(Session& session);
  void stream_data(Session& session);

  void notify(const TransferEvent& event);

  Options options_;
  std::shared_ptr<Logger> logger_;
  FileIndex index_;
  ConnectionSlotPool slots_;
  UploadConsentBroker consent_;
  CancelTokenPtr shutdown_;

  asio::io_context accept_io_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::thread accept_thread_;
  std::unique_ptr<asio::thread_pool> workers_;

  std::mutex streams_mutex_;
  std::set<std::shared_ptr<SocketStream>> streams_;

  std::mutex observer_mutex_;
  TransferObserver observer_;

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> refused_{0};
  std::uint16_t port_ = 0;
};

const char* server_state_name(FileServer::State state);
