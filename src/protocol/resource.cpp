#include "protocol/resource.hpp"
#include "protocol/gntp_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

void ResourceArena::reference(const std::string& identifier) {
  if (resources_.emplace(identifier, std::nullopt).second) {
    BOOST_LOG_TRIVIAL(debug) << "Resource arena: Expecting resource " << identifier;
  }
}

void ResourceArena::attach(Resource resource) {
  const std::string identifier = resource.identifier;
  auto it = resources_.find(identifier);
  if (it == resources_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Resource arena: Resource " << identifier
                               << " was sent but never referenced";
    resources_.emplace(identifier, std::move(resource));
    return;
  }

  if (it->second) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Duplicate resource: " + identifier);
  }

  it->second = std::move(resource);
}

std::size_t ResourceArena::pending_count() const {
  return static_cast<std::size_t>(std::count_if(resources_.begin(), resources_.end(),
      [](const auto& entry) { return !entry.second.has_value(); }));
}

bool ResourceArena::is_referenced(const std::string& identifier) const {
  return resources_.count(identifier) > 0;
}

const Resource* ResourceArena::find(const std::string& identifier) const {
  auto it = resources_.find(identifier);
  if (it == resources_.end() || !it->second) {
    return nullptr;
  }
  return &*it->second;
}

std::vector<Resource> ResourceArena::attached() const {
  std::vector<Resource> result;
  for (const auto& [identifier, resource] : resources_) {
    if (resource) {
      result.push_back(*resource);
    }
  }
  return result;
}

} // namespace protocol
} // namespace gntp
