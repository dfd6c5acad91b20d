#include "peer_registry.hpp"

#include <algorithm>
#include <tuple>

#include "address.hpp"

std::string PeerRecord::key() const {
  return HostPort{host, port}.to_string();
}

PeerRegistry::PeerRegistry(std::chrono::milliseconds staleness, NowFn now)
  : staleness_(staleness), now_(std::move(now)) {}

PeerRegistry::Clock::time_point PeerRegistry::now() const {
  return now_ ? now_() : Clock::now();
}

bool PeerRegistry::is_stale(const PeerRecord& record, Clock::time_point now) const {
  return now - record.last_seen > staleness_;
}

bool PeerRegistry::upsert(const std::string& host,
                          std::uint16_t port,
                          const std::string& display_name,
                          const std::string& instance_id) {
  PeerRecord record;
  record.host = host;
  record.port = port;
  record.display_name = display_name;
  record.instance_id = instance_id;
  record.last_seen = now();

  std::lock_guard<std::mutex> lock(mutex_);
  auto key = record.key();
  auto it = peers_.find(key);
  bool fresh = (it == peers_.end()) || is_stale(it->second, record.last_seen);
  peers_[key] = std::move(record);
  return fresh;
}

std::size_t PeerRegistry::evict_stale() {
  auto current = now();
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for(auto it = peers_.begin(); it != peers_.end();) {
    if(is_stale(it->second, current)) {
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::vector<PeerRecord> PeerRegistry::snapshot() const {
  auto current = now();
  std::vector<PeerRecord> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(peers_.size());
    for(const auto& [key, record] : peers_) {
      if(!is_stale(record, current)) out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const PeerRecord& a, const PeerRecord& b){
    return std::tie(a.display_name, a.host, a.port) < std::tie(b.display_name, b.host, b.port);
  });
  return out;
}

std::size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

void PeerRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.clear();
}
