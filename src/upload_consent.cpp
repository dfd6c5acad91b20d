#include "upload_consent.hpp"

const char* consent_decision_name(ConsentDecision decision) {
  switch(decision) {
    case ConsentDecision::Pending: return "pending";
    case ConsentDecision::Accepted: return "accepted";
    case ConsentDecision::Rejected: return "rejected";
    case ConsentDecision::TimedOut: return "timed out";
  }
  return "unknown";
}

UploadConsentRequest::UploadConsentRequest(std::uint64_t id,
                                           std::string filename,
                                           std::uint64_t size,
                                           std::string sender_address,
                                           Clock::time_point deadline)
  : id_(id),
    filename_(std::move(filename)),
    size_(size),
    sender_address_(std::move(sender_address)),
    deadline_(deadline),
    future_(promise_.get_future().share()) {}

bool UploadConsentRequest::resolve(ConsentDecision decision) {
  bool expected = false;
  if(!resolved_.compare_exchange_strong(expected, true)) return false;
  promise_.set_value(decision);
  return true;
}

ConsentDecision UploadConsentRequest::wait() {
  if(future_.wait_until(deadline_) == std::future_status::timeout) {
    resolve(ConsentDecision::TimedOut);
  }
  return future_.get();
}

ConsentDecision UploadConsentRequest::decision() const {
  if(future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    return ConsentDecision::Pending;
  }
  return future_.get();
}

UploadConsentBroker::UploadConsentBroker(std::chrono::milliseconds timeout)
  : timeout_(timeout) {}

void UploadConsentBroker::set_handler(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void UploadConsentBroker::set_timeout(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  timeout_ = timeout;
}

std::chrono::milliseconds UploadConsentBroker::timeout() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timeout_;
}

UploadConsentRequestPtr UploadConsentBroker::open(const std::string& filename,
                                                  std::uint64_t size,
                                                  const std::string& sender_address) {
  UploadConsentRequestPtr request;
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    request = std::make_shared<UploadConsentRequest>(
      next_id_++, filename, size, sender_address,
      UploadConsentRequest::Clock::now() + timeout_);
    requests_[request->id()] = request;
    handler = handler_;
  }
  if(handler) handler(request);
  return request;
}

void UploadConsentBroker::close(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.erase(id);
}

std::vector<UploadConsentRequestPtr> UploadConsentBroker::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UploadConsentRequestPtr> out;
  for(const auto& [id, request] : requests_) {
    if(!request->resolved()) out.push_back(request);
  }
  return out;
}

bool UploadConsentBroker::resolve(std::uint64_t id, bool accept) {
  UploadConsentRequestPtr request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(id);
    if(it == requests_.end()) return false;
    request = it->second;
  }
  return accept ? request->accept() : request->reject();
}

void UploadConsentBroker::reject_all() {
  std::vector<UploadConsentRequestPtr> open_requests;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& [id, request] : requests_) open_requests.push_back(request);
  }
  for(auto& request : open_requests) request->reject();
}
