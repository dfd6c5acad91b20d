#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct PeerRecord {
  std::string host;
  std::uint16_t port = 0;          // peer's TCP listening port
  std::string display_name;
  std::string instance_id;         // empty for peers that do not send one
  std::chrono::steady_clock::time_point last_seen;

  std::string key() const;
};

// Lock-guarded table of discovered peers keyed by host and TCP port. The
// discovery beacon writes it; everyone else reads snapshots.
class PeerRegistry {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit PeerRegistry(std::chrono::milliseconds staleness = std::chrono::seconds(15),
                        NowFn now = nullptr);

  // Inserts or refreshes; returns true when the peer was not known before.
  bool upsert(const std::string& host,
              std::uint16_t port,
              const std::string& display_name,
              const std::string& instance_id = std::string());

  // Drops records older than the staleness window; returns how many.
  std::size_t evict_stale();

  // Ordered by display name, then host, then port. Stale records are never
  // returned even if the sweep has not run yet.
  std::vector<PeerRecord> snapshot() const;

  std::size_t size() const;
  void clear();

  std::chrono::milliseconds staleness() const { return staleness_; }

private:
  Clock::time_point now() const;
  bool is_stale(const PeerRecord& record, Clock::time_point now) const;

  std::chrono::milliseconds staleness_;
  NowFn now_;
  mutable std::mutex mutex_;
  std::map<std::string, PeerRecord> peers_;
};
