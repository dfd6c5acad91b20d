#include "lantern_node.hpp"

#include "discovery_beacon.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::chrono::milliseconds seconds_setting(const SettingsManager& settings, const std::string& key) {
  return std::chrono::seconds(settings.get<long long>(key));
}

std::chrono::milliseconds millis_setting(const SettingsManager& settings, const std::string& key) {
  return std::chrono::milliseconds(settings.get<long long>(key));
}

} // namespace

LanternNode::LanternNode(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("node")) {}

LanternNode::~LanternNode() {
  stop();
}

void LanternNode::start() {
  if(started_) return;

  display_name_ = settings_->get<std::string>("display_name");
  if(display_name_.empty()) display_name_ = local_hostname();
  instance_id_ = random_instance_id();

  auto configured_dir = settings_->get<std::string>("shared_dir");
  shared_dir_ = configured_dir.empty() ? default_shared_dir() : std::filesystem::path(configured_dir);

  const auto tcp_port = static_cast<std::uint16_t>(settings_->get<long long>("tcp_port"));
  const auto udp_port = static_cast<std::uint16_t>(settings_->get<long long>("udp_port"));
  const auto bind_ip = settings_->get<std::string>("bind_ip");
  default_peer_port_ = tcp_port != 0 ? tcp_port : 5000;

  registry_ = std::make_shared<PeerRegistry>(seconds_setting(*settings_, "peer_timeout_s"));

  FileServer::Options server_options;
  server_options.bind_ip = bind_ip;
  server_options.port = tcp_port;
  server_options.shared_dir = shared_dir_;
  server_options.max_connections = static_cast<std::size_t>(settings_->get<long long>("max_connections"));
  server_options.chunk_size = static_cast<std::size_t>(settings_->get<long long>("chunk_size"));
  server_options.io_timeout = millis_setting(*settings_, "io_timeout_ms");
  server_options.consent_timeout = seconds_setting(*settings_, "consent_timeout_s");
  server_options.large_transfer_bytes = static_cast<std::uint64_t>(settings_->get<long long>("large_transfer_bytes"));
  server_ = std::make_unique<FileServer>(server_options, std::make_shared<Logger>("server"));
  if(pending_consent_handler_) server_->set_upload_consent_handler(pending_consent_handler_);
  if(pending_observer_) server_->set_transfer_observer(pending_observer_);

  RequestClient::Options client_options;
  client_options.connect_timeout = millis_setting(*settings_, "connect_timeout_ms");
  client_options.io_timeout = millis_setting(*settings_, "io_timeout_ms");
  client_options.consent_wait = seconds_setting(*settings_, "consent_timeout_s") + std::chrono::seconds(5);
  client_options.chunk_size = server_options.chunk_size;
  client_options.download_dir = shared_dir_;
  client_ = std::make_unique<RequestClient>(client_options, std::make_shared<Logger>("client"));

  server_->start();

  if(options_.enable_discovery) {
    DiscoveryBeacon::Options beacon_options;
    beacon_options.bind_ip = bind_ip;
    beacon_options.udp_port = udp_port;
    beacon_options.tcp_port = server_->port();
    beacon_options.display_name = display_name_;
    beacon_options.instance_id = instance_id_;
    beacon_options.interval = seconds_setting(*settings_, "beacon_interval_s");
    beacon_options.targets = options_.beacon_targets;
    beacon_options.target_port = options_.beacon_target_port;
    beacon_ = std::make_unique<DiscoveryBeacon>(registry_, beacon_options,
                                                std::make_shared<Logger>("discovery"));
    try {
      beacon_->start();
    } catch(const LanternError&) {
      server_->stop();
      throw;
    }
  }

  started_ = true;
  logger_->info("'{}' up: TCP {} UDP {} sharing {}", display_name_, tcp_port(), udp_port(),
                shared_dir_.string());
}

void LanternNode::stop() {
  if(!started_) return;
  started_ = false;
  if(beacon_) beacon_->stop();
  if(server_) server_->stop();
  logger_->info("'{}' stopped", display_name_);
}

std::vector<PeerRecord> LanternNode::list_peers() const {
  if(!registry_) return {};
  return registry_->snapshot();
}

ListResult LanternNode::list_remote_files(const std::string& host, std::uint16_t port) {
  if(!client_) {
    ListResult result;
    result.code = ErrorCode::InternalError;
    result.message = "node is not started";
    return result;
  }
  return client_->list(host, port);
}

TransferResult LanternNode::download_file(const std::string& host,
                                          std::uint16_t port,
                                          const std::string& name,
                                          const ProgressCallback& on_progress,
                                          const CancelTokenPtr& cancel) {
  if(!client_) {
    TransferResult result;
    result.code = ErrorCode::InternalError;
    result.message = "node is not started";
    return result;
  }
  return client_->download(host, port, name, on_progress, cancel);
}

TransferResult LanternNode::upload_file(const std::string& host,
                                        std::uint16_t port,
                                        const std::filesystem::path& path,
                                        const ProgressCallback& on_progress,
                                        const CancelTokenPtr& cancel) {
  if(!client_) {
    TransferResult result;
    result.code = ErrorCode::InternalError;
    result.message = "node is not started";
    return result;
  }
  return client_->upload(host, port, path, on_progress, cancel);
}

void LanternNode::set_upload_consent_handler(UploadConsentBroker::Handler handler) {
  pending_consent_handler_ = handler;
  if(server_) server_->set_upload_consent_handler(std::move(handler));
}

void LanternNode::set_transfer_observer(FileServer::TransferObserver observer) {
  pending_observer_ = observer;
  if(server_) server_->set_transfer_observer(std::move(observer));
}

std::vector<UploadConsentRequestPtr> LanternNode::pending_uploads() const {
  if(!server_) return {};
  return server_->pending_uploads();
}

bool LanternNode::resolve_upload(std::uint64_t id, bool accept) {
  return server_ && server_->resolve_upload(id, accept);
}

std::vector<FileEntry> LanternNode::list_local_files() const {
  if(server_) return server_->index().list();
  auto configured_dir = settings_->get<std::string>("shared_dir");
  return FileIndex(configured_dir.empty() ? default_shared_dir() : std::filesystem::path(configured_dir)).list();
}

std::uint16_t LanternNode::tcp_port() const {
  return server_ ? server_->port() : 0;
}

std::uint16_t LanternNode::udp_port() const {
  return beacon_ ? beacon_->local_port() : 0;
}
