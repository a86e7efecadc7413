#ifndef GNTP_CRYPTO_PASSWORD_KEYRING_HPP
#define GNTP_CRYPTO_PASSWORD_KEYRING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "digest.hpp"

namespace gntp::crypto {

/**
 * Holds the passwords a sender may authenticate with and resolves a
 * request-line key hash to the key it was derived from.
 */
class PasswordKeyring {
public:
  PasswordKeyring() = default;
  explicit PasswordKeyring(std::vector<std::string> passwords);

  void add_password(const std::string& password);
  bool empty() const { return passwords_.empty(); }
  std::size_t size() const { return passwords_.size(); }

  /**
   * Computes digest(password ++ salt) for every configured password and
   * compares it with the supplied hash. The first match wins.
   * @return the matching digest, which doubles as the decryption key, or
   *         std::nullopt when no password matches
   * @throws std::invalid_argument if hash_hex or salt_hex is not valid hex
   */
  std::optional<std::vector<uint8_t>> matching_key(HashAlgorithm algorithm,
                                                   const std::string& hash_hex,
                                                   const std::string& salt_hex) const;

  // Builds the key a sender derives from password and salt
  static std::vector<uint8_t> derive_key(HashAlgorithm algorithm, const std::string& password,
                                         const std::vector<uint8_t>& salt);

private:
  std::vector<std::string> passwords_;
};

} // namespace gntp::crypto

#endif // GNTP_CRYPTO_PASSWORD_KEYRING_HPP
