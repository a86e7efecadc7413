#include "protocol/request_line.hpp"
#include "protocol/gntp_error.hpp"
#include <stdexcept>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

namespace {

void parse_protocol_field(const std::string& field, RequestLine& request_line) {
  std::vector<std::string> protocol_and_version;
  boost::algorithm::split(protocol_and_version, field, boost::algorithm::is_any_of("/"));
  if (protocol_and_version.size() != 2) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Expected GNTP/1.0 protocol header");
  }
  if (protocol_and_version[0] != SUPPORTED_PROTOCOL) {
    throw GntpException(ErrorCode::UNKNOWN_PROTOCOL, protocol_and_version[0]);
  }
  if (protocol_and_version[1] != SUPPORTED_PROTOCOL_VERSION) {
    throw GntpException(ErrorCode::UNKNOWN_PROTOCOL_VERSION, protocol_and_version[1]);
  }
  request_line.version = protocol_and_version[1];
}

void parse_encryption_field(const std::string& field, RequestLine& request_line) {
  const auto colon = field.find(':');
  const std::string name = field.substr(0, colon);
  const std::string iv_hex = colon == std::string::npos ? "" : field.substr(colon + 1);

  auto algorithm = crypto::algorithm_from_string(name);
  if (!algorithm) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Unsupported encryption type: " + name);
  }
  request_line.encryption = *algorithm;

  try {
    request_line.iv = crypto::from_hex(iv_hex);
  } catch (const std::invalid_argument& e) {
    throw GntpException(ErrorCode::INVALID_REQUEST, std::string("Invalid IV: ") + e.what());
  }
}

void parse_auth_field(const std::string& field, RequestLine& request_line) {
  std::vector<std::string> algorithm_and_hash;
  boost::algorithm::split(algorithm_and_hash, field, boost::algorithm::is_any_of(":"));
  if (algorithm_and_hash.size() != 2) {
    throw GntpException(ErrorCode::NOT_AUTHORIZED, "Unable to parse hash");
  }

  auto algorithm = crypto::hash_algorithm_from_string(algorithm_and_hash[0]);
  if (!algorithm) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Unsupported hash type: " + algorithm_and_hash[0]);
  }

  const std::string& hash_dot_salt = algorithm_and_hash[1];
  const auto dot = hash_dot_salt.find('.');
  if (dot == std::string::npos || dot < 1 || dot == hash_dot_salt.size() - 1) {
    throw GntpException(ErrorCode::NOT_AUTHORIZED, "Unable to parse hash");
  }

  AuthSpec auth{*algorithm, hash_dot_salt.substr(0, dot), hash_dot_salt.substr(dot + 1)};
  try {
    crypto::from_hex(auth.hash_hex);
    crypto::from_hex(auth.salt_hex);
  } catch (const std::invalid_argument&) {
    throw GntpException(ErrorCode::NOT_AUTHORIZED, "Key hash or salt is not hex");
  }
  request_line.auth = std::move(auth);
}

} // namespace

RequestLine parse_request_line(const std::string& line) {
  // Line can end with extraneous whitespace
  const std::string trimmed = boost::algorithm::trim_copy(line);

  std::vector<std::string> fields;
  boost::algorithm::split(fields, trimmed, boost::algorithm::is_any_of(" "));

  // A foreign protocol is reported as such even when the rest of the line is malformed
  RequestLine request_line;
  parse_protocol_field(fields[0], request_line);

  if (fields.size() < 3 || fields.size() > 4) {
    throw GntpException(ErrorCode::INVALID_REQUEST,
                        "Expected 3 or 4 fields, found " + std::to_string(fields.size()) + " fields");
  }

  auto message_type = message_type_from_string(fields[1]);
  if (!message_type) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Unknown message type: " + fields[1]);
  }
  request_line.message_type = *message_type;

  parse_encryption_field(fields[2], request_line);

  if (fields.size() == 4) {
    parse_auth_field(fields[3], request_line);
  }

  BOOST_LOG_TRIVIAL(debug) << "Request line: " << message_type_to_string(request_line.message_type)
                           << " encryption=" << crypto::algorithm_to_string(request_line.encryption)
                           << " auth=" << (request_line.auth ? crypto::hash_algorithm_to_string(request_line.auth->algorithm) : "none");
  return request_line;
}

} // namespace protocol
} // namespace gntp
