#include "store/memory_store.hpp"
#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace store {

//==============================================
// MEMORY STORE
//==============================================

MemoryStore::MemoryStore(std::size_t max_bytes) : max_bytes_(max_bytes) {}

CacheSlot MemoryStore::acquire_cache_slot(const std::string& identifier, const protocol::HeaderBlock& /*headers*/) {
  CacheSlot slot;
  slot.identifier = identifier;
  slot.location = LOCATION_PREFIX + identifier;
  slot.already_cached = has(identifier);
  if (!slot.already_cached) {
    slot.sink = std::make_shared<std::ostringstream>(std::ios::binary);
  }
  return slot;
}

void MemoryStore::commit_cache_slot(const CacheSlot& slot) {
  auto buffer = std::dynamic_pointer_cast<std::ostringstream>(slot.sink);
  if (!buffer) {
    throw std::invalid_argument("Memory store: Slot for " + slot.identifier + " has no buffer");
  }
  std::string payload = buffer->str();

  std::lock_guard<std::mutex> lock(mutex_);
  erase_locked(slot.identifier);

  if (payload.size() > max_bytes_) {
    BOOST_LOG_TRIVIAL(warning) << "Memory store: Dropped " << payload.size() << " bytes for "
                               << slot.identifier << ", over the " << max_bytes_ << " byte limit";
    return;
  }

  while (total_bytes_ + payload.size() > max_bytes_ && !order_.empty()) {
    const std::string oldest = order_.front();
    BOOST_LOG_TRIVIAL(debug) << "Memory store: Evicting " << oldest;
    erase_locked(oldest);
  }

  total_bytes_ += payload.size();
  order_.push_back(slot.identifier);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Stored " << payload.size() << " bytes for " << slot.identifier;
  resources_[slot.identifier] = std::move(payload);
}

void MemoryStore::erase_locked(const std::string& identifier) {
  auto it = resources_.find(identifier);
  if (it == resources_.end()) {
    return;
  }
  total_bytes_ -= it->second.size();
  resources_.erase(it);
  order_.erase(std::find(order_.begin(), order_.end(), identifier));
}

std::optional<std::string> MemoryStore::get(const std::string& identifier) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = resources_.find(identifier);
  if (it == resources_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryStore::has(const std::string& identifier) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resources_.count(identifier) > 0;
}

std::size_t MemoryStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resources_.size();
}

std::size_t MemoryStore::total_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_bytes_;
}

//==============================================
// DISCARD STORE
//==============================================

CacheSlot DiscardStore::acquire_cache_slot(const std::string& identifier, const protocol::HeaderBlock& /*headers*/) {
  CacheSlot slot;
  slot.identifier = identifier;
  return slot;
}

void DiscardStore::commit_cache_slot(const CacheSlot& slot) {
  BOOST_LOG_TRIVIAL(debug) << "Discard store: Dropped resource " << slot.identifier;
}

} // namespace store
} // namespace gntp
