#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "beacon.hpp"
#include "peer_registry.hpp"

class Logger;

// Announces this node over UDP broadcast and feeds beacons heard from other
// nodes into a PeerRegistry. Sending, receiving and the staleness sweep all
// run as async tasks on one private io thread.
class DiscoveryBeacon {
public:
  struct Options {
    std::string bind_ip = "0.0.0.0";
    std::uint16_t udp_port = 5001;      // 0 picks an ephemeral port
    std::uint16_t tcp_port = 5000;      // advertised file server port
    std::string display_name;
    std::string instance_id;
    std::chrono::milliseconds interval{5000};
    std::chrono::milliseconds sweep_interval{1000};
    // Replace interface broadcast addresses (tests send to loopback).
    std::vector<std::string> targets;
    std::uint16_t target_port = 0;      // 0: same as udp_port
  };

  DiscoveryBeacon(std::shared_ptr<PeerRegistry> registry,
                  Options options,
                  std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryBeacon();

  DiscoveryBeacon(const DiscoveryBeacon&) = delete;
  DiscoveryBeacon& operator=(const DiscoveryBeacon&) = delete;

  // Binds the UDP endpoint and starts the io thread. A bind failure closes
  // the socket and throws LanternError(IoError).
  void start();
  void stop();
  bool running() const { return running_.load(); }

  std::uint16_t local_port() const { return local_port_; }
  std::size_t beacons_sent() const { return beacons_sent_.load(); }

  // Parses one datagram from `sender_host` and upserts the registry. Returns
  // false when it was malformed or our own.
  bool handle_datagram(const std::string& datagram, const std::string& sender_host);

  std::vector<std::string> current_targets() const;

private:
  using udp = asio::ip::udp;

  void start_receive();
  void send_beacon();
  void schedule_send();
  void schedule_sweep();

  std::shared_ptr<PeerRegistry> registry_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  udp::socket socket_;
  asio::steady_timer send_timer_;
  asio::steady_timer sweep_timer_;
  std::thread io_thread_;
  std::array<char, kMaxBeaconBytes + 1> recv_buffer_{};
  udp::endpoint sender_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> beacons_sent_{0};
  std::uint16_t local_port_ = 0;
};
