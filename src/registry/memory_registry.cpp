#include "registry/memory_registry.hpp"
#include <mutex>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace registry {

MemoryRegistry::MemoryRegistry(crypto::PasswordKeyring keyring)
  : keyring_(std::move(keyring)) {
  BOOST_LOG_TRIVIAL(info) << "Registry: Initialized with " << keyring_.size() << " passwords";
}

//==============================================
// APPLICATIONS
//==============================================

std::optional<Application> MemoryRegistry::resolve_application(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto it = applications_.find(name);
  if (it == applications_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Application MemoryRegistry::register_application(const std::string& name, const std::string& icon) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = applications_.find(name);
  if (it != applications_.end()) {
    it->second.icon = icon;
    BOOST_LOG_TRIVIAL(info) << "Registry: Re-registering application \"" << name
                            << "\" with ID = " << it->second.id;
    return it->second;
  }

  Application application;
  application.id = next_id_++;
  application.name = name;
  application.icon = icon;
  applications_.emplace(name, application);
  BOOST_LOG_TRIVIAL(info) << "Registry: Registered new application \"" << name
                          << "\" with ID = " << application.id;
  return application;
}

//==============================================
// NOTIFICATION TYPES
//==============================================

std::optional<NotificationType> MemoryRegistry::resolve_notification_type(const Application& application,
                                                                          const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto it = notification_types_.find({application.name, name});
  if (it == notification_types_.end()) {
    return std::nullopt;
  }
  return it->second;
}

NotificationType MemoryRegistry::register_notification_type(const Application& application,
                                                            const std::string& name,
                                                            const std::string& display_name,
                                                            bool enabled,
                                                            const std::string& icon) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (applications_.count(application.name) == 0) {
    throw std::invalid_argument("Registry: Unknown application: " + application.name);
  }

  auto& type = notification_types_[{application.name, name}];
  if (type.id == 0) {
    type.id = next_id_++;
    BOOST_LOG_TRIVIAL(info) << "Registry: Registered notification type \"" << name
                            << "\" for \"" << application.name << "\"";
  } else {
    BOOST_LOG_TRIVIAL(info) << "Registry: Updated notification type \"" << name
                            << "\" for \"" << application.name << "\"";
  }

  type.application = application.name;
  type.name = name;
  type.display_name = display_name.empty() ? name : display_name;
  type.enabled = enabled;
  type.icon = icon;
  return type;
}

//==============================================
// AUTHENTICATION
//==============================================

std::optional<std::vector<uint8_t>> MemoryRegistry::matching_key(crypto::HashAlgorithm algorithm,
                                                                 const std::string& hash_hex,
                                                                 const std::string& salt_hex) const {
  return keyring_.matching_key(algorithm, hash_hex, salt_hex);
}

bool MemoryRegistry::requires_authentication() const {
  return !keyring_.empty();
}

//==============================================
// UTILITY METHODS
//==============================================

std::size_t MemoryRegistry::application_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return applications_.size();
}

std::size_t MemoryRegistry::notification_type_count(const std::string& application) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::size_t count = 0;
  for (const auto& [key, type] : notification_types_) {
    if (key.first == application) {
      ++count;
    }
  }
  return count;
}

} // namespace registry
} // namespace gntp
