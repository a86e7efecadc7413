#ifndef GNTP_PROTOCOL_RESPONSE_HPP
#define GNTP_PROTOCOL_RESPONSE_HPP

#include <exception>
#include <ostream>
#include <string>
#include "protocol/constants.hpp"
#include "protocol/gntp_error.hpp"
#include "protocol/header_block.hpp"

namespace gntp {
namespace protocol {

enum class ResponseType {
  OK,
  ERROR
};

// Identity of this listener, sent in the Origin-* headers
struct OriginInfo {
  std::string machine_name;
  std::string software_name;
  std::string software_version;
  std::string platform_name;
  std::string platform_version;

  // Describes the local host and this build
  static OriginInfo local();
};

class Response {
public:
  // ---- FACTORIES ----
  // OK response carrying Response-Action and, for SUBSCRIBE, Subscription-TTL
  static Response ok(MessageType action);
  static Response error(ErrorCode code, const std::string& description);


  // ---- HEADERS ----
  void add_header(const std::string& key, const std::string& value);
  void add_origin_headers(const OriginInfo& origin);


  // ---- SERIALIZATION ----
  // Status line, headers and closing blank line, all CRLF terminated
  std::string serialize() const;
  void write(std::ostream& output) const;
  // Reads back a serialized response; throws GntpException(INVALID_REQUEST)
  // on a malformed status line
  static Response parse(const std::string& text);


  // ---- GETTERS ----
  ResponseType get_type() const { return type_; }
  const HeaderBlock& get_headers() const { return headers_; }

private:
  explicit Response(ResponseType type) : type_(type) {}

  ResponseType type_;
  HeaderBlock headers_;
};

// Maps any failure raised while handling a request to an ERROR response
Response map_exception(const std::exception& e);

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_RESPONSE_HPP
