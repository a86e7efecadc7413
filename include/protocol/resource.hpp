#ifndef GNTP_PROTOCOL_RESOURCE_HPP
#define GNTP_PROTOCOL_RESOURCE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "protocol/header_block.hpp"

namespace gntp {
namespace protocol {

// A binary payload embedded in a request
struct Resource {
  std::string identifier;
  std::uint64_t length = 0;
  // Set when the store already held this payload and the wire bytes were discarded
  bool cached = false;
  // Where the resource store keeps the bytes (path, memory key, or empty)
  std::string location;
  HeaderBlock headers;
};

/**
 * Resources of one request, indexed by identifier. A header value naming
 * x-growl-resource://<id> creates an unresolved placeholder; the resource
 * sub-protocol later fills it. Lookups happen lazily at dispatch time.
 */
class ResourceArena {
public:
  // Adds an unresolved placeholder unless the identifier is already known
  void reference(const std::string& identifier);

  // Throws GntpException(INVALID_REQUEST) if the identifier was already attached
  void attach(Resource resource);

  bool has_pending() const { return pending_count() > 0; }
  std::size_t pending_count() const;
  bool empty() const { return resources_.empty(); }
  bool is_referenced(const std::string& identifier) const;

  // nullptr for unknown or still unresolved identifiers
  const Resource* find(const std::string& identifier) const;

  // Attached resources in identifier order
  std::vector<Resource> attached() const;

private:
  std::map<std::string, std::optional<Resource>> resources_;
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_RESOURCE_HPP
