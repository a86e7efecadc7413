#ifndef GNTP_REGISTRY_MEMORY_REGISTRY_HPP
#define GNTP_REGISTRY_MEMORY_REGISTRY_HPP

#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
#include "registry/registry.hpp"
#include "crypto/password_keyring.hpp"

namespace gntp {
namespace registry {

// Registry kept in memory. Lookups share a reader lock; registrations take the
// writer lock.
class MemoryRegistry : public Registry {
public:
  // Delete copy constructor and assignment operator
  MemoryRegistry(const MemoryRegistry&) = delete;
  MemoryRegistry& operator=(const MemoryRegistry&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemoryRegistry(crypto::PasswordKeyring keyring = crypto::PasswordKeyring());
  ~MemoryRegistry() override = default;


  // ---- APPLICATIONS ----
  std::optional<Application> resolve_application(const std::string& name) const override;
  Application register_application(const std::string& name, const std::string& icon) override;


  // ---- NOTIFICATION TYPES ----
  std::optional<NotificationType> resolve_notification_type(const Application& application,
                                                            const std::string& name) const override;
  NotificationType register_notification_type(const Application& application,
                                              const std::string& name,
                                              const std::string& display_name,
                                              bool enabled,
                                              const std::string& icon) override;


  // ---- AUTHENTICATION ----
  std::optional<std::vector<uint8_t>> matching_key(crypto::HashAlgorithm algorithm,
                                                   const std::string& hash_hex,
                                                   const std::string& salt_hex) const override;
  bool requires_authentication() const override;


  // ---- UTILITY METHODS ----
  std::size_t application_count() const;
  std::size_t notification_type_count(const std::string& application) const;

private:
  // ---- PARAMETERS ----
  const crypto::PasswordKeyring keyring_;

  std::map<std::string, Application> applications_;
  // Keyed by (application name, type name)
  std::map<std::pair<std::string, std::string>, NotificationType> notification_types_;
  int next_id_ = 1;

  mutable std::shared_mutex mutex_;
};

} // namespace registry
} // namespace gntp

#endif // GNTP_REGISTRY_MEMORY_REGISTRY_HPP
