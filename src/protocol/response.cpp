#include "protocol/response.hpp"
#include "crypto/crypto_error.hpp"
#include <algorithm>
#include <sstream>
#include <sys/utsname.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/system_error.hpp>

namespace gntp {
namespace protocol {

namespace {

constexpr const char* SOFTWARE_NAME = "gntpd";
constexpr const char* SOFTWARE_VERSION = "1.0.0";

std::string status_line(ResponseType type) {
  return std::string(SUPPORTED_PROTOCOL) + "/" + SUPPORTED_PROTOCOL_VERSION + " " +
         (type == ResponseType::OK ? RESPONSE_OK : RESPONSE_ERROR) + " NONE";
}

} // namespace

//==============================================
// ORIGIN
//==============================================

OriginInfo OriginInfo::local() {
  OriginInfo origin;
  origin.software_name = SOFTWARE_NAME;
  origin.software_version = SOFTWARE_VERSION;

  try {
    origin.machine_name = boost::asio::ip::host_name();
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Response: Unable to resolve host name: " << e.what();
    origin.machine_name = "localhost";
  }

  struct utsname info;
  if (uname(&info) == 0) {
    origin.platform_name = info.sysname;
    origin.platform_version = info.release;
  } else {
    origin.platform_name = "Unknown";
  }
  return origin;
}

//==============================================
// FACTORIES
//==============================================

Response Response::ok(MessageType action) {
  Response response(ResponseType::OK);
  response.add_header(headers::RESPONSE_ACTION, message_type_to_string(action));
  if (action == MessageType::SUBSCRIBE) {
    response.add_header(headers::SUBSCRIPTION_TTL, SUBSCRIPTION_TTL);
  }
  return response;
}

Response Response::error(ErrorCode code, const std::string& description) {
  Response response(ResponseType::ERROR);
  response.add_header(headers::ERROR_CODE, std::to_string(error_code_value(code)));
  response.add_header(headers::ERROR_DESCRIPTION, description);
  return response;
}

//==============================================
// HEADERS
//==============================================

void Response::add_header(const std::string& key, const std::string& value) {
  // A line break inside a value would end the header block early
  std::string sanitized = value;
  std::replace(sanitized.begin(), sanitized.end(), '\r', ' ');
  std::replace(sanitized.begin(), sanitized.end(), '\n', ' ');
  headers_.set(key, sanitized);
}

void Response::add_origin_headers(const OriginInfo& origin) {
  add_header(headers::ORIGIN_MACHINE_NAME, origin.machine_name);
  add_header(headers::ORIGIN_SOFTWARE_NAME, origin.software_name);
  add_header(headers::ORIGIN_SOFTWARE_VERSION, origin.software_version);
  add_header(headers::ORIGIN_PLATFORM_NAME, origin.platform_name);
  add_header(headers::ORIGIN_PLATFORM_VERSION, origin.platform_version);
}

//==============================================
// SERIALIZATION
//==============================================

std::string Response::serialize() const {
  std::ostringstream out;
  out << status_line(type_) << LINE_TERMINATOR;
  for (const auto& [key, value] : headers_) {
    out << key << ": " << value << LINE_TERMINATOR;
  }
  out << LINE_TERMINATOR;
  return out.str();
}

void Response::write(std::ostream& output) const {
  const std::string text = serialize();
  output.write(text.data(), static_cast<std::streamsize>(text.size()));
  output.flush();
}

Response Response::parse(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  if (!std::getline(in, line)) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Empty response");
  }
  boost::algorithm::trim(line);

  Response response(ResponseType::OK);
  if (line == status_line(ResponseType::OK)) {
    response.type_ = ResponseType::OK;
  } else if (line == status_line(ResponseType::ERROR)) {
    response.type_ = ResponseType::ERROR;
  } else {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Unexpected status line: " + line);
  }

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    parse_header(line, response.headers_);
  }
  return response;
}

//==============================================
// ERROR MAPPING
//==============================================

Response map_exception(const std::exception& e) {
  if (const auto* gntp_error = dynamic_cast<const GntpException*>(&e)) {
    const std::string description = gntp_error->detail().empty()
        ? error_code_to_string(gntp_error->code())
        : gntp_error->detail();
    return Response::error(gntp_error->code(), description);
  }

  if (dynamic_cast<const crypto::DecryptionError*>(&e)) {
    return Response::error(ErrorCode::INVALID_REQUEST, "Unable to decrypt message");
  }

  return Response::error(ErrorCode::INTERNAL_SERVER_ERROR, e.what());
}

} // namespace protocol
} // namespace gntp
