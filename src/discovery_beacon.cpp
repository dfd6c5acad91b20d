#include "discovery_beacon.hpp"

#include "address.hpp"
#include "errors.hpp"
#include "log.hpp"

DiscoveryBeacon::DiscoveryBeacon(std::shared_ptr<PeerRegistry> registry,
                                 Options options,
                                 std::shared_ptr<Logger> logger)
  : registry_(std::move(registry)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")),
    socket_(io_),
    send_timer_(io_),
    sweep_timer_(io_) {
  if(options_.interval.count() <= 0) options_.interval = std::chrono::seconds(5);
  if(options_.sweep_interval.count() <= 0) options_.sweep_interval = std::chrono::seconds(1);
}

DiscoveryBeacon::~DiscoveryBeacon() {
  stop();
}

void DiscoveryBeacon::start() {
  if(running_) return;

  std::error_code ec;
  auto address = asio::ip::make_address_v4(options_.bind_ip, ec);
  if(ec) {
    throw LanternError(ErrorCode::InvalidArgument, "invalid bind address '" + options_.bind_ip + "'");
  }
  udp::endpoint endpoint(address, options_.udp_port);
  socket_.open(endpoint.protocol(), ec);
  if(!ec) socket_.set_option(udp::socket::reuse_address(true), ec);
  if(!ec) socket_.set_option(asio::socket_base::broadcast(true), ec);
  if(!ec) socket_.bind(endpoint, ec);
  if(ec) {
    std::error_code ignored;
    socket_.close(ignored);
    throw LanternError(ErrorCode::IoError,
                       "cannot bind UDP " + options_.bind_ip + ":" +
                       std::to_string(options_.udp_port) + ": " + ec.message());
  }
  local_port_ = socket_.local_endpoint(ec).port();

  running_ = true;
  io_.restart();
  start_receive();
  asio::post(io_, [this](){ send_beacon(); });
  schedule_send();
  schedule_sweep();
  io_thread_ = std::thread([this](){ io_.run(); });

  logger_->info("discovery listening on UDP {} (announcing TCP {} as '{}')",
                local_port_, options_.tcp_port, options_.display_name);
}

void DiscoveryBeacon::stop() {
  if(!running_.exchange(false)) return;
  asio::post(io_, [this](){
    std::error_code ec;
    send_timer_.cancel();
    sweep_timer_.cancel();
    socket_.close(ec);
  });
  if(io_thread_.joinable()) io_thread_.join();
  io_.stop();
  logger_->debug("discovery stopped");
}

void DiscoveryBeacon::start_receive() {
  socket_.async_receive_from(asio::buffer(recv_buffer_), sender_,
    [this](const std::error_code& ec, std::size_t bytes){
      if(ec) {
        if(ec == asio::error::operation_aborted || !running_) return;
        logger_->debug("beacon receive failed: {}", ec.message());
      } else if(bytes <= kMaxBeaconBytes) {
        handle_datagram(std::string(recv_buffer_.data(), bytes), sender_.address().to_string());
      }
      if(running_) start_receive();
    });
}

bool DiscoveryBeacon::handle_datagram(const std::string& datagram, const std::string& sender_host) {
  auto info = parse_beacon(datagram);
  if(!info) {
    logger_->debug("ignoring malformed beacon from {}", sender_host);
    return false;
  }
  if(!options_.instance_id.empty() && info->instance_id == options_.instance_id) {
    return false;
  }
  if(registry_->upsert(sender_host, info->tcp_port, info->display_name, info->instance_id)) {
    logger_->info("discovered '{}' at {}", info->display_name,
                  HostPort{sender_host, info->tcp_port}.to_string());
  }
  return true;
}

std::vector<std::string> DiscoveryBeacon::current_targets() const {
  if(!options_.targets.empty()) return options_.targets;
  return broadcast_targets(local_ipv4_interfaces());
}

void DiscoveryBeacon::send_beacon() {
  if(!running_) return;
  BeaconInfo info;
  info.tcp_port = options_.tcp_port;
  info.display_name = options_.display_name;
  info.instance_id = options_.instance_id;
  auto payload = encode_beacon(info);
  const auto port = options_.target_port ? options_.target_port : options_.udp_port;

  for(const auto& target : current_targets()) {
    std::error_code ec;
    auto address = asio::ip::make_address_v4(target, ec);
    if(ec) {
      logger_->warn("skipping invalid beacon target '{}'", target);
      continue;
    }
    socket_.send_to(asio::buffer(payload), udp::endpoint(address, port), 0, ec);
    if(ec) {
      logger_->debug("beacon to {}:{} failed: {}", target, port, ec.message());
    } else {
      ++beacons_sent_;
    }
  }
}

void DiscoveryBeacon::schedule_send() {
  send_timer_.expires_after(options_.interval);
  send_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    send_beacon();
    schedule_send();
  });
}

void DiscoveryBeacon::schedule_sweep() {
  sweep_timer_.expires_after(options_.sweep_interval);
  sweep_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    auto removed = registry_->evict_stale();
    if(removed > 0) {
      logger_->debug("evicted {} stale peer(s)", removed);
    }
    schedule_sweep();
  });
}
