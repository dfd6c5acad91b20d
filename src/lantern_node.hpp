#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "client.hpp"
#include "peer_registry.hpp"
#include "server.hpp"

class DiscoveryBeacon;
class Logger;
class SettingsManager;

// One LAN node: file server, discovery beacon, peer registry and request
// client wired together from settings. The shell and tests talk to this.
class LanternNode {
public:
  struct Options {
    bool enable_discovery = true;
    // Passed through to the beacon; tests aim it at loopback.
    std::vector<std::string> beacon_targets;
    std::uint16_t beacon_target_port = 0;
  };

  explicit LanternNode(std::shared_ptr<SettingsManager> settings, Options options = Options{});
  ~LanternNode();

  LanternNode(const LanternNode&) = delete;
  LanternNode& operator=(const LanternNode&) = delete;

  // Creates the shared directory, binds the server and the beacon. Throws
  // LanternError; anything already started is stopped again first.
  void start();
  void stop();
  bool running() const { return started_; }

  std::vector<PeerRecord> list_peers() const;
  ListResult list_remote_files(const std::string& host, std::uint16_t port);
  TransferResult download_file(const std::string& host,
                               std::uint16_t port,
                               const std::string& name,
                               const ProgressCallback& on_progress = nullptr,
                               const CancelTokenPtr& cancel = nullptr);
  TransferResult upload_file(const std::string& host,
                             std::uint16_t port,
                             const std::filesystem::path& path,
                             const ProgressCallback& on_progress = nullptr,
                             const CancelTokenPtr& cancel = nullptr);

  void set_upload_consent_handler(UploadConsentBroker::Handler handler);
  void set_transfer_observer(FileServer::TransferObserver observer);
  std::vector<UploadConsentRequestPtr> pending_uploads() const;
  bool resolve_upload(std::uint64_t id, bool accept);

  std::vector<FileEntry> list_local_files() const;

  std::uint16_t tcp_port() const;
  std::uint16_t udp_port() const;
  const std::string& display_name() const { return display_name_; }
  const std::string& instance_id() const { return instance_id_; }
  const std::filesystem::path& shared_dir() const { return shared_dir_; }
  std::uint16_t default_peer_port() const { return default_peer_port_; }

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<PeerRegistry> registry() const { return registry_; }

private:
  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<PeerRegistry> registry_;
  std::unique_ptr<FileServer> server_;
  std::unique_ptr<DiscoveryBeacon> beacon_;
  std::unique_ptr<RequestClient> client_;
  UploadConsentBroker::Handler pending_consent_handler_;
  FileServer::TransferObserver pending_observer_;

  std::string display_name_;
  std::string instance_id_;
  std::filesystem::path shared_dir_;
  std::uint16_t default_peer_port_ = 5000;
  bool started_ = false;
};
