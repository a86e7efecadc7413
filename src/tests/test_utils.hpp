#ifndef GNTP_TEST_UTILS_HPP
#define GNTP_TEST_UTILS_HPP

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include "crypto/cipher_stream.hpp"
#include "crypto/digest.hpp"
#include "crypto/password_keyring.hpp"
#include "protocol/encryption_layer.hpp"

namespace gntp {
namespace test {

// Keep test output quiet
inline void quiet_logging(boost::log::trivial::severity_level level = boost::log::trivial::error) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

// Joins lines, each terminated with CRLF
inline std::string crlf(std::initializer_list<std::string> lines) {
    std::string result;
    for (const auto& line : lines) {
        result += line;
        result += "\r\n";
    }
    return result;
}

inline std::vector<uint8_t> test_salt() {
    return {0x10, 0x32, 0x54, 0x76, 0x98, 0xba, 0xdc, 0xfe};
}

// "<ALGO>:<hash hex>.<salt hex>" as a sender builds it from its password
inline std::string key_hash_field(crypto::HashAlgorithm algorithm,
                                  const std::string& password,
                                  const std::vector<uint8_t>& salt = test_salt()) {
    const auto key = crypto::PasswordKeyring::derive_key(algorithm, password, salt);
    return std::string(crypto::hash_algorithm_to_string(algorithm)) + ":" +
           crypto::to_hex(key) + "." + crypto::to_hex(salt);
}

// A deterministic IV of the size the algorithm needs
inline std::vector<uint8_t> test_iv(crypto::Algorithm algorithm) {
    std::vector<uint8_t> iv(crypto::CipherStream::iv_size(algorithm));
    for (std::size_t i = 0; i < iv.size(); ++i) {
        iv[i] = static_cast<uint8_t>(0xa0 + i);
    }
    return iv;
}

// Encryption layer a sender would use with password and the test salt
inline protocol::EncryptionLayer sender_encryption(crypto::Algorithm algorithm,
                                                   crypto::HashAlgorithm hash,
                                                   const std::string& password) {
    return protocol::EncryptionLayer(algorithm,
                                     crypto::PasswordKeyring::derive_key(hash, password, test_salt()),
                                     test_iv(algorithm));
}

} // namespace test
} // namespace gntp

#endif // GNTP_TEST_UTILS_HPP
