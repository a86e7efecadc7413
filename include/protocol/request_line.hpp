#ifndef GNTP_PROTOCOL_REQUEST_LINE_HPP
#define GNTP_PROTOCOL_REQUEST_LINE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "crypto/cipher_stream.hpp"
#include "crypto/digest.hpp"
#include "protocol/constants.hpp"

namespace gntp {
namespace protocol {

// <HashAlgo>:<hashHex>.<saltHex>
struct AuthSpec {
  crypto::HashAlgorithm algorithm;
  std::string hash_hex;
  std::string salt_hex;
};

/**
 * First line of every request:
 *   GNTP/<version> <MessageType> <EncAlgo>[:<ivHex>][ <HashAlgo>:<hashHex>.<saltHex>]
 */
struct RequestLine {
  std::string version;
  MessageType message_type = MessageType::NOTIFY;
  crypto::Algorithm encryption = crypto::Algorithm::NONE;
  std::vector<uint8_t> iv;
  std::optional<AuthSpec> auth;
};

/**
 * Parses and validates a request line.
 * @throws GntpException UNKNOWN_PROTOCOL or UNKNOWN_PROTOCOL_VERSION for a
 *         foreign protocol, NOT_AUTHORIZED for a malformed key hash field and
 *         INVALID_REQUEST for everything else
 */
RequestLine parse_request_line(const std::string& line);

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_REQUEST_LINE_HPP
