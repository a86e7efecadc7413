#ifndef GNTP_CRYPTO_DIGEST_HPP
#define GNTP_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace gntp::crypto {

// Key hash algorithms accepted on the request line
enum class HashAlgorithm {
  MD5,
  SHA1,
  SHA256,
  SHA512
};

std::optional<HashAlgorithm> hash_algorithm_from_string(const std::string& name);
const char* hash_algorithm_to_string(HashAlgorithm algorithm);

// Computes the digest of data with OpenSSL EVP
std::vector<uint8_t> compute_digest(HashAlgorithm algorithm, const std::vector<uint8_t>& data);

// Lowercase hex encoding
std::string to_hex(const std::vector<uint8_t>& bytes);
// Accepts either case; throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> from_hex(const std::string& hex);

} // namespace gntp::crypto

#endif // GNTP_CRYPTO_DIGEST_HPP
