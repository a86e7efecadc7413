#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gntp::crypto {

namespace {

const EVP_MD* evp_digest(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::MD5:    return EVP_md5();
    case HashAlgorithm::SHA1:   return EVP_sha1();
    case HashAlgorithm::SHA256: return EVP_sha256();
    case HashAlgorithm::SHA512: return EVP_sha512();
  }
  return nullptr;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// ALGORITHM NAMES
//==============================================

std::optional<HashAlgorithm> hash_algorithm_from_string(const std::string& name) {
  if (name == "MD5")    return HashAlgorithm::MD5;
  if (name == "SHA1")   return HashAlgorithm::SHA1;
  if (name == "SHA256") return HashAlgorithm::SHA256;
  if (name == "SHA512") return HashAlgorithm::SHA512;
  return std::nullopt;
}

const char* hash_algorithm_to_string(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::MD5:    return "MD5";
    case HashAlgorithm::SHA1:   return "SHA1";
    case HashAlgorithm::SHA256: return "SHA256";
    case HashAlgorithm::SHA512: return "SHA512";
  }
  return "UNKNOWN";
}

//==============================================
// DIGEST COMPUTATION
//==============================================

std::vector<uint8_t> compute_digest(HashAlgorithm algorithm, const std::vector<uint8_t>& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw DigestError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, evp_digest(algorithm), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, data.data(), data.size())) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  BOOST_LOG_TRIVIAL(trace) << "Digest: Computed " << hash_algorithm_to_string(algorithm)
                           << " over " << data.size() << " bytes";
  return std::vector<uint8_t>(hash, hash + hash_len);
}

//==============================================
// HEX CONVERSION
//==============================================

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::vector<uint8_t> from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Hex string has odd length");
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Invalid hex character in: " + hex);
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return bytes;
}

} // namespace gntp::crypto
