#ifndef GNTP_REGISTRY_REGISTRY_HPP
#define GNTP_REGISTRY_REGISTRY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "crypto/digest.hpp"

namespace gntp {
namespace registry {

// A registered sender identity
struct Application {
  int id = 0;
  std::string name;
  std::string icon;
  bool enabled = true;
};

// A named category of notification owned by an application
struct NotificationType {
  int id = 0;
  std::string application;
  std::string name;
  std::string display_name;
  bool enabled = false;
  std::string icon;
};

/**
 * Storage of applications, notification types and passwords. Implementations
 * synchronize internally; lookups return snapshots.
 */
class Registry {
public:
  virtual ~Registry() = default;

  // ---- APPLICATIONS ----
  virtual std::optional<Application> resolve_application(const std::string& name) const = 0;
  // Creates the application or updates the icon of an existing one
  virtual Application register_application(const std::string& name, const std::string& icon) = 0;


  // ---- NOTIFICATION TYPES ----
  virtual std::optional<NotificationType> resolve_notification_type(const Application& application,
                                                                    const std::string& name) const = 0;
  // Creates the type or updates an existing (application, name) pair
  virtual NotificationType register_notification_type(const Application& application,
                                                      const std::string& name,
                                                      const std::string& display_name,
                                                      bool enabled,
                                                      const std::string& icon) = 0;


  // ---- AUTHENTICATION ----
  // Key derived from the password that produced hash_hex with salt_hex, if any
  virtual std::optional<std::vector<uint8_t>> matching_key(crypto::HashAlgorithm algorithm,
                                                           const std::string& hash_hex,
                                                           const std::string& salt_hex) const = 0;
  virtual bool requires_authentication() const = 0;

protected:
  Registry() = default;
};

} // namespace registry
} // namespace gntp

#endif // GNTP_REGISTRY_REGISTRY_HPP
