#include "store/store.hpp"
#include "crypto/digest.hpp"
#include <fstream>
#include <memory>
#include <mutex>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
Store::Store(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path;
  check_directory_exists(base_path_);
}

//==============================================
// RESOURCE STORE
//==============================================

CacheSlot Store::acquire_cache_slot(const std::string& identifier, const protocol::HeaderBlock& /*headers*/) {
  CacheSlot slot;
  slot.identifier = identifier;

  const std::filesystem::path file_path = resolve_key_path(identifier);
  slot.location = file_path.string();

  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Cache hit for resource " << identifier;
    slot.already_cached = true;
    return slot;
  }

  check_directory_exists(file_path.parent_path());
  const std::string part_path = slot.location + "." + std::to_string(next_part_++) + ".part";
  auto file = std::make_shared<std::ofstream>(part_path, std::ios::binary | std::ios::trunc);
  if (!*file) {
    throw StoreError("Store: Failed to create file: " + part_path);
  }
  slot.sink = file;

  std::lock_guard<std::mutex> lock(mutex_);
  pending_[file.get()] = part_path;

  BOOST_LOG_TRIVIAL(debug) << "Store: Cache miss for resource " << identifier << ", writing " << part_path;
  return slot;
}

void Store::commit_cache_slot(const CacheSlot& slot) {
  const std::filesystem::path part_path = take_pending(slot);
  if (part_path.empty()) {
    throw StoreError("Store: Slot for " + slot.identifier + " was not issued by this store");
  }

  auto file = std::dynamic_pointer_cast<std::ofstream>(slot.sink);
  file->close();
  if (file->fail()) {
    std::error_code ec;
    std::filesystem::remove(part_path, ec);
    throw StoreError("Store: Failed to write resource " + slot.identifier);
  }

  // Concurrent writers of the same key produce identical bytes; last rename wins
  std::error_code ec;
  std::filesystem::rename(part_path, slot.location, ec);
  if (ec) {
    throw StoreError("Store: Failed to commit resource " + slot.identifier + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Stored resource " << slot.identifier << " at " << slot.location;
}

void Store::abandon_cache_slot(const CacheSlot& slot) {
  const std::filesystem::path part_path = take_pending(slot);
  if (part_path.empty()) {
    return;
  }

  if (auto file = std::dynamic_pointer_cast<std::ofstream>(slot.sink)) {
    file->close();
  }
  std::error_code ec;
  std::filesystem::remove(part_path, ec);
  BOOST_LOG_TRIVIAL(debug) << "Store: Abandoned partial resource " << slot.identifier;
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& key) const {
  return std::filesystem::exists(resolve_key_path(key));
}

std::filesystem::path Store::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(hash_key(key));
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string Store::hash_key(const std::string& key) const {
  try {
    return crypto::to_hex(crypto::compute_digest(crypto::HashAlgorithm::SHA256,
                                                 std::vector<uint8_t>(key.begin(), key.end())));
  } catch (const crypto::CryptoError& e) {
    throw StoreError(std::string("Store: Failed to hash key: ") + e.what());
  }
}

std::filesystem::path Store::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::path Store::take_pending(const CacheSlot& slot) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = pending_.find(slot.sink.get());
  if (it == pending_.end()) {
    return {};
  }
  std::filesystem::path part_path = it->second;
  pending_.erase(it);
  return part_path;
}

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace gntp
