#ifndef GNTP_STORE_RESOURCE_STORE_HPP
#define GNTP_STORE_RESOURCE_STORE_HPP

#include <memory>
#include <ostream>
#include <string>
#include "protocol/header_block.hpp"

namespace gntp {
namespace store {

// Where the payload of one resource goes
struct CacheSlot {
  std::string identifier;
  // The payload is already held; wire bytes are read and discarded
  bool already_cached = false;
  std::string location;
  // Receives the decrypted payload on a cache miss. May be null to discard.
  std::shared_ptr<std::ostream> sink;
};

/**
 * Destination of embedded resource payloads. Implementations synchronize
 * internally since every connection shares one store.
 */
class ResourceStore {
public:
  virtual ~ResourceStore() = default;

  virtual CacheSlot acquire_cache_slot(const std::string& identifier,
                                       const protocol::HeaderBlock& headers) = 0;
  // Called once all payload bytes were written to the slot sink
  virtual void commit_cache_slot(const CacheSlot& slot) = 0;
  // Called instead of commit when the payload could not be read or decrypted
  virtual void abandon_cache_slot(const CacheSlot& /*slot*/) {}

protected:
  ResourceStore() = default;
};

} // namespace store
} // namespace gntp

#endif // GNTP_STORE_RESOURCE_STORE_HPP
