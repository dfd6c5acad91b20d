#include "connection_slots.hpp"

void ConnectionSlot::release() {
  if(pool_) {
    pool_->give_back();
    pool_ = nullptr;
  }
}

std::optional<ConnectionSlot> ConnectionSlotPool::try_acquire() {
  auto current = in_use_.load();
  do {
    if(current >= capacity_) return std::nullopt;
  } while(!in_use_.compare_exchange_weak(current, current + 1));
  return ConnectionSlot(this);
}

void ConnectionSlotPool::give_back() {
  in_use_.fetch_sub(1);
}
