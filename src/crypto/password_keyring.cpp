#include "crypto/password_keyring.hpp"
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>

namespace gntp::crypto {

PasswordKeyring::PasswordKeyring(std::vector<std::string> passwords)
  : passwords_(std::move(passwords)) {
  BOOST_LOG_TRIVIAL(debug) << "Password keyring: Loaded " << passwords_.size() << " passwords";
}

void PasswordKeyring::add_password(const std::string& password) {
  passwords_.push_back(password);
}

std::vector<uint8_t> PasswordKeyring::derive_key(HashAlgorithm algorithm, const std::string& password,
                                                 const std::vector<uint8_t>& salt) {
  std::vector<uint8_t> material(password.begin(), password.end());
  material.insert(material.end(), salt.begin(), salt.end());
  return compute_digest(algorithm, material);
}

std::optional<std::vector<uint8_t>> PasswordKeyring::matching_key(HashAlgorithm algorithm,
                                                                  const std::string& hash_hex,
                                                                  const std::string& salt_hex) const {
  const std::vector<uint8_t> hash = from_hex(hash_hex);
  const std::vector<uint8_t> salt = from_hex(salt_hex);

  for (const auto& password : passwords_) {
    std::vector<uint8_t> candidate = derive_key(algorithm, password, salt);
    if (candidate.size() == hash.size() &&
        CRYPTO_memcmp(candidate.data(), hash.data(), hash.size()) == 0) {
      BOOST_LOG_TRIVIAL(debug) << "Password keyring: " << hash_algorithm_to_string(algorithm)
                               << " key hash matched a configured password";
      return candidate;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Password keyring: No password matches the supplied key hash";
  return std::nullopt;
}

} // namespace gntp::crypto
