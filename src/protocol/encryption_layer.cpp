#include "protocol/encryption_layer.hpp"
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

EncryptionLayer::EncryptionLayer(crypto::Algorithm algorithm, std::vector<uint8_t> key,
                                 std::vector<uint8_t> iv)
  : algorithm_(algorithm)
  , key_(std::move(key))
  , iv_(std::move(iv)) {
  // Validate the parameters up front so the request fails before any block is read
  crypto::CipherStream probe;
  probe.initialize(algorithm_, key_, iv_);
  BOOST_LOG_TRIVIAL(debug) << "Encryption layer: Using " << crypto::algorithm_to_string(algorithm_);
}

std::string EncryptionLayer::decrypt(const std::string& ciphertext) const {
  if (!enabled()) {
    return ciphertext;
  }

  crypto::CipherStream cipher;
  cipher.initialize(algorithm_, key_, iv_);
  return cipher.decrypt(ciphertext);
}

std::string EncryptionLayer::encrypt(const std::string& plaintext) const {
  if (!enabled()) {
    return plaintext;
  }

  crypto::CipherStream cipher;
  cipher.initialize(algorithm_, key_, iv_);
  return cipher.encrypt(plaintext);
}

} // namespace protocol
} // namespace gntp
