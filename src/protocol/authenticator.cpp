#include "protocol/authenticator.hpp"
#include "protocol/gntp_error.hpp"
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

Authenticator::Authenticator(const registry::Registry& registry, AuthFailurePolicy policy)
  : registry_(registry)
  , policy_(policy) {}

AuthResult Authenticator::authenticate(const RequestLine& request_line) const {
  AuthResult result;

  if (!request_line.auth) {
    if (registry_.requires_authentication()) {
      BOOST_LOG_TRIVIAL(warning) << "Authenticator: Password required but request carries no key hash";
      throw GntpException(ErrorCode::NOT_AUTHORIZED, "Missing key hash");
    }
    return result;
  }

  const AuthSpec& auth = *request_line.auth;
  auto key = registry_.matching_key(auth.algorithm, auth.hash_hex, auth.salt_hex);
  if (key) {
    BOOST_LOG_TRIVIAL(debug) << "Authenticator: Key hash matched ("
                             << crypto::hash_algorithm_to_string(auth.algorithm) << ")";
    result.key = std::move(*key);
    return result;
  }

  // Only a plaintext NOTIFY may be silently ignored; without the key an
  // encrypted request cannot be parsed at all
  if (policy_ == AuthFailurePolicy::IGNORE_NOTIFY &&
      request_line.message_type == MessageType::NOTIFY &&
      request_line.encryption == crypto::Algorithm::NONE) {
    BOOST_LOG_TRIVIAL(warning) << "Authenticator: Key hash mismatch, ignoring NOTIFY";
    result.outcome = AuthOutcome::IGNORE;
    return result;
  }

  BOOST_LOG_TRIVIAL(warning) << "Authenticator: Key hash mismatch for "
                             << message_type_to_string(request_line.message_type);
  throw GntpException(ErrorCode::NOT_AUTHORIZED, "Incorrect password");
}

} // namespace protocol
} // namespace gntp
