#ifndef GNTP_STORE_STORE_HPP
#define GNTP_STORE_STORE_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include "store/resource_store.hpp"

namespace gntp {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Content-addressed resource store on disk. Resource identifiers are hashed
 * with SHA-256 and laid out as {base}/{h[0:2]}/{h[2:4]}/{h[4:6]}/{h[6:]}.
 * A payload already on disk is a cache hit.
 */
class Store : public ResourceStore {
public:
  // Delete copy constructor and assignment operator
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::string& base_path);
  ~Store() override = default;


  // ---- RESOURCE STORE ----
  CacheSlot acquire_cache_slot(const std::string& identifier,
                               const protocol::HeaderBlock& headers) override;
  // Moves the partial file into place
  void commit_cache_slot(const CacheSlot& slot) override;
  // Deletes the partial file
  void abandon_cache_slot(const CacheSlot& slot) override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  // Path a key is stored under, whether or not it exists
  std::filesystem::path resolve_key_path(const std::string& key) const;

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  const std::filesystem::path base_path_;
  // Distinguishes concurrent partial files of the same key
  std::atomic<std::uint64_t> next_part_{0};
  // Partial file behind each open slot sink
  std::map<const std::ostream*, std::filesystem::path> pending_;
  std::mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // SHA-256 of key as lowercase hex
  std::string hash_key(const std::string& key) const;
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- UTILITY METHODS ----
  // Forgets the partial file of slot; empty path if the slot is unknown
  std::filesystem::path take_pending(const CacheSlot& slot);
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace gntp

#endif // GNTP_STORE_STORE_HPP
