#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class ConsentDecision { Pending, Accepted, Rejected, TimedOut };

const char* consent_decision_name(ConsentDecision decision);

// An announced upload waiting for the local user. The first of accept(),
// reject() or the deadline wins; later calls are ignored.
class UploadConsentRequest {
public:
  using Clock = std::chrono::steady_clock;

  UploadConsentRequest(std::uint64_t id,
                       std::string filename,
                       std::uint64_t size,
                       std::string sender_address,
                       Clock::time_point deadline);

  std::uint64_t id() const { return id_; }
  const std::string& filename() const { return filename_; }
  std::uint64_t size() const { return size_; }
  const std::string& sender_address() const { return sender_address_; }
  Clock::time_point deadline() const { return deadline_; }

  // Return false when the request was already resolved.
  bool accept() { return resolve(ConsentDecision::Accepted); }
  bool reject() { return resolve(ConsentDecision::Rejected); }

  // Blocks until a decision or the deadline; a missed deadline resolves the
  // request to TimedOut.
  ConsentDecision wait();

  ConsentDecision decision() const;
  bool resolved() const { return resolved_.load(); }

private:
  bool resolve(ConsentDecision decision);

  std::uint64_t id_;
  std::string filename_;
  std::uint64_t size_;
  std::string sender_address_;
  Clock::time_point deadline_;

  std::atomic<bool> resolved_{false};
  std::promise<ConsentDecision> promise_;
  std::shared_future<ConsentDecision> future_;
};

using UploadConsentRequestPtr = std::shared_ptr<UploadConsentRequest>;

// Decision point for incoming uploads. The optional handler is called on the
// connection thread as soon as a request is created; it may decide at once
// or keep the pointer and decide later from any thread.
class UploadConsentBroker {
public:
  using Handler = std::function<void(const UploadConsentRequestPtr&)>;

  explicit UploadConsentBroker(std::chrono::milliseconds timeout = std::chrono::seconds(60));

  void set_handler(Handler handler);
  void set_timeout(std::chrono::milliseconds timeout);
  std::chrono::milliseconds timeout() const;

  UploadConsentRequestPtr open(const std::string& filename,
                               std::uint64_t size,
                               const std::string& sender_address);
  void close(std::uint64_t id);

  std::vector<UploadConsentRequestPtr> pending() const;

  // Returns false for an unknown or already resolved id.
  bool resolve(std::uint64_t id, bool accept);

  // Rejects everything still pending (server shutdown).
  void reject_all();

private:
  mutable std::mutex mutex_;
  std::chrono::milliseconds timeout_;
  Handler handler_;
  std::map<std::uint64_t, UploadConsentRequestPtr> requests_;
  std::uint64_t next_id_ = 1;
};
