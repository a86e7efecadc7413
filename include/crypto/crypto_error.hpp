#ifndef GNTP_CRYPTO_ERROR_HPP
#define GNTP_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gntp::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad key/IV sizes or an unusable cipher
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Bad padding or tampered ciphertext
class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

} // namespace gntp::crypto

#endif // GNTP_CRYPTO_ERROR_HPP
