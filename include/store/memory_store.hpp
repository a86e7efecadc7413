#ifndef GNTP_STORE_MEMORY_STORE_HPP
#define GNTP_STORE_MEMORY_STORE_HPP

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "store/resource_store.hpp"

namespace gntp {
namespace store {

/**
 * Keeps resource payloads in memory, keyed by identifier. Payloads are held
 * up to max_bytes in total; committing past the limit evicts the oldest
 * payloads first, and a payload larger than the limit is not kept at all.
 */
class MemoryStore : public ResourceStore {
public:
  static constexpr const char* LOCATION_PREFIX = "memory://";
  static constexpr std::size_t DEFAULT_MAX_BYTES = 64 * 1024 * 1024;

  explicit MemoryStore(std::size_t max_bytes = DEFAULT_MAX_BYTES);

  CacheSlot acquire_cache_slot(const std::string& identifier,
                               const protocol::HeaderBlock& headers) override;
  void commit_cache_slot(const CacheSlot& slot) override;

  std::optional<std::string> get(const std::string& identifier) const;
  bool has(const std::string& identifier) const;
  std::size_t size() const;
  std::size_t total_bytes() const;
  std::size_t max_bytes() const { return max_bytes_; }

private:
  const std::size_t max_bytes_;
  std::map<std::string, std::string> resources_;
  // Identifiers in commit order, oldest first
  std::deque<std::string> order_;
  std::size_t total_bytes_ = 0;
  mutable std::mutex mutex_;

  // Caller holds mutex_
  void erase_locked(const std::string& identifier);
};

// Reads resource payloads off the wire and drops them
class DiscardStore : public ResourceStore {
public:
  CacheSlot acquire_cache_slot(const std::string& identifier,
                               const protocol::HeaderBlock& headers) override;
  void commit_cache_slot(const CacheSlot& slot) override;
};

} // namespace store
} // namespace gntp

#endif // GNTP_STORE_MEMORY_STORE_HPP
