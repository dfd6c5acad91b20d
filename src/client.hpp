#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "address.hpp"
#include "protocol.hpp"
#include "transfer_engine.hpp"

class Logger;
class SocketStream;

struct ListResult {
  ErrorCode code = ErrorCode::Ok;
  std::string message;
  std::vector<RemoteFile> files;
  bool truncated = false;

  bool ok() const { return code == ErrorCode::Ok; }
};

// One request per connection against a remote FileServer. Nothing here
// throws: every failure comes back as a result code with a local message.
class RequestClient {
public:
  struct Options {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds io_timeout{30000};
    // How long to wait for the remote user's upload decision.
    std::chrono::milliseconds consent_wait{65000};
    std::size_t chunk_size = kDefaultChunkSize;
    std::filesystem::path download_dir;
  };

  explicit RequestClient(Options options, std::shared_ptr<Logger> logger = nullptr);

  ListResult list(const std::string& host, std::uint16_t port);

  // Saves into download_dir under the base name of `filename`.
  TransferResult download(const std::string& host,
                          std::uint16_t port,
                          const std::string& filename,
                          const ProgressCallback& on_progress = nullptr,
                          const CancelTokenPtr& cancel = nullptr);

  // Announces `path`, waits for the remote decision, then streams it.
  TransferResult upload(const std::string& host,
                        std::uint16_t port,
                        const std::filesystem::path& path,
                        const ProgressCallback& on_progress = nullptr,
                        const CancelTokenPtr& cancel = nullptr);

  const Options& options() const { return options_; }
  void set_download_dir(std::filesystem::path dir) { options_.download_dir = std::move(dir); }

private:
  std::unique_ptr<SocketStream> open(const std::string& host, std::uint16_t port);

  Options options_;
  std::shared_ptr<Logger> logger_;
};
