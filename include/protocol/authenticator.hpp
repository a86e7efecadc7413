#ifndef GNTP_PROTOCOL_AUTHENTICATOR_HPP
#define GNTP_PROTOCOL_AUTHENTICATOR_HPP

#include <cstdint>
#include <vector>
#include "protocol/request_line.hpp"
#include "registry/registry.hpp"

namespace gntp {
namespace protocol {

enum class AuthOutcome {
  AUTHORIZED,
  // Parse the request to completion but never dispatch it
  IGNORE
};

// What to do with a NOTIFY whose key hash matches no password
enum class AuthFailurePolicy {
  REJECT,
  IGNORE_NOTIFY
};

struct AuthResult {
  AuthOutcome outcome = AuthOutcome::AUTHORIZED;
  // Decryption key; empty when no key hash was sent
  std::vector<uint8_t> key;
};

class Authenticator {
public:
  explicit Authenticator(const registry::Registry& registry,
                         AuthFailurePolicy policy = AuthFailurePolicy::REJECT);

  /**
   * Checks the key hash of a request line against the configured passwords.
   * @return the derived key, or an IGNORE outcome under IGNORE_NOTIFY
   * @throws GntpException(NOT_AUTHORIZED) when no password matches or a
   *         required key hash is missing
   */
  AuthResult authenticate(const RequestLine& request_line) const;

  AuthFailurePolicy get_policy() const { return policy_; }

private:
  const registry::Registry& registry_;
  const AuthFailurePolicy policy_;
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_AUTHENTICATOR_HPP
