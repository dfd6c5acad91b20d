#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

class ConnectionSlotPool;

// Admission ticket for one serviced connection. Move-only; the slot goes back
// to the pool when the ticket is destroyed, whichever way the handler exits.
class ConnectionSlot {
public:
  ConnectionSlot() = default;
  ~ConnectionSlot() { release(); }

  ConnectionSlot(ConnectionSlot&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
  ConnectionSlot& operator=(ConnectionSlot&& other) noexcept {
    if(this != &other) {
      release();
      pool_ = other.pool_;
      other.pool_ = nullptr;
    }
    return *this;
  }

  ConnectionSlot(const ConnectionSlot&) = delete;
  ConnectionSlot& operator=(const ConnectionSlot&) = delete;

  bool valid() const { return pool_ != nullptr; }
  void release();

private:
  friend class ConnectionSlotPool;
  explicit ConnectionSlot(ConnectionSlotPool* pool) : pool_(pool) {}

  ConnectionSlotPool* pool_ = nullptr;
};

// Counting admission cap. try_acquire never blocks: a full pool means the
// caller refuses the connection.
class ConnectionSlotPool {
public:
  explicit ConnectionSlotPool(std::size_t capacity) : capacity_(capacity) {}

  std::optional<ConnectionSlot> try_acquire();

  std::size_t in_use() const { return in_use_.load(); }
  std::size_t capacity() const { return capacity_; }

private:
  friend class ConnectionSlot;
  void give_back();

  const std::size_t capacity_;
  std::atomic<std::size_t> in_use_{0};
};
