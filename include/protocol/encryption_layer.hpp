#ifndef GNTP_PROTOCOL_ENCRYPTION_LAYER_HPP
#define GNTP_PROTOCOL_ENCRYPTION_LAYER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto/cipher_stream.hpp"

namespace gntp {
namespace protocol {

// Per-request algorithm, key and IV. Each call works on an independent range:
// the cipher is reinitialized with the same key and IV every time.
class EncryptionLayer {
public:
  // Pass-through layer for NONE
  EncryptionLayer() = default;
  // Throws crypto::InitializationError when key or IV do not fit the algorithm
  EncryptionLayer(crypto::Algorithm algorithm, std::vector<uint8_t> key, std::vector<uint8_t> iv);

  crypto::Algorithm algorithm() const { return algorithm_; }
  bool enabled() const { return algorithm_ != crypto::Algorithm::NONE; }

  // Throws crypto::DecryptionError on bad padding or tampered bytes
  std::string decrypt(const std::string& ciphertext) const;
  std::string encrypt(const std::string& plaintext) const;

private:
  crypto::Algorithm algorithm_ = crypto::Algorithm::NONE;
  std::vector<uint8_t> key_;
  std::vector<uint8_t> iv_;
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_ENCRYPTION_LAYER_HPP
