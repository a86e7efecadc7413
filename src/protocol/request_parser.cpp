#include "protocol/request_parser.hpp"
#include "protocol/gntp_error.hpp"
#include "protocol/request_line.hpp"
#include "protocol/resource_reader.hpp"
#include "crypto/crypto_error.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

RequestParser::RequestParser(LineReader& reader, const Authenticator& authenticator, store::ResourceStore& store)
  : reader_(reader)
  , authenticator_(authenticator)
  , store_(store) {}

//==============================================
// PARSING
//==============================================

std::optional<PendingRequest> RequestParser::parse() {
  try {
    while (state_ != State::END_OF_REQUEST) {
      State next = state_;
      switch (state_) {
        case State::CONNECTED:                    next = on_connected(); break;
        case State::READING_REQUEST_HEADERS:      next = on_request_header(); break;
        case State::READING_NOTIFICATION_HEADERS: next = on_notification_header(); break;
        case State::READING_RESOURCE_HEADERS:     next = on_resource_header(); break;
        case State::READING_RESOURCE_DATA:        next = on_resource_data(); break;
        case State::END_OF_REQUEST:
        case State::RESPONSE_SENT:
          throw GntpException(ErrorCode::INTERNAL_SERVER_ERROR,
                              "Parser invoked in state " + state_to_string(state_));
      }

      if (next != state_) {
        BOOST_LOG_TRIVIAL(trace) << "Request parser: " << state_ << " -> " << next;
      }
      state_ = next;
    }
  } catch (const EndOfStream& e) {
    BOOST_LOG_TRIVIAL(info) << "Request parser: " << e.what() << " in state " << state_;
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "Request parser: Completed " << message_type_to_string(request_.message_type)
                           << " request with " << request_.headers.size() << " headers, "
                           << request_.notification_types.size() << " notification types, "
                           << request_.resources.attached().size() << " resources";
  return std::move(request_);
}

//==============================================
// STATE TRANSITIONS
//==============================================

RequestParser::State RequestParser::on_connected() {
  std::string line;
  if (!reader_.read_line(line)) {
    throw EndOfStream("before request line");
  }

  const RequestLine request_line = parse_request_line(line);
  AuthResult auth = authenticator_.authenticate(request_line);

  request_.message_type = request_line.message_type;
  request_.ignored = auth.outcome == AuthOutcome::IGNORE;
  request_.received_at = std::chrono::system_clock::now();

  configure_encryption(request_line, std::move(auth.key));
  reader_.read_encrypted_block(encryption_);
  return State::READING_REQUEST_HEADERS;
}

RequestParser::State RequestParser::on_request_header() {
  const std::string line = next_line();
  if (!line.empty()) {
    record_header(line, request_.headers);
    return State::READING_REQUEST_HEADERS;
  }

  // Stray blank lines before the first header are skipped
  if (request_.headers.empty()) {
    return State::READING_REQUEST_HEADERS;
  }

  if (request_.message_type != MessageType::REGISTER) {
    return after_notifications();
  }

  const std::string count = request_.headers.get_or(headers::NOTIFICATIONS_COUNT, "");
  const bool numeric = !count.empty() && count.size() < 10 &&
      std::all_of(count.begin(), count.end(), [](unsigned char c) { return std::isdigit(c); });
  if (!numeric) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Invalid Notifications-Count: " + count);
  }

  notification_count_ = std::stoull(count);
  request_.notification_types.reserve(notification_count_);
  BOOST_LOG_TRIVIAL(debug) << "Request parser: Expecting " << notification_count_ << " notification types";

  if (notification_count_ == 0) {
    return after_notifications();
  }
  current_block_.clear();
  return State::READING_NOTIFICATION_HEADERS;
}

RequestParser::State RequestParser::on_notification_header() {
  const std::string line = next_line();
  if (!line.empty()) {
    record_header(line, current_block_);
    return State::READING_NOTIFICATION_HEADERS;
  }

  request_.notification_types.push_back(NotificationTypeSpec::from_headers(current_block_));
  current_block_.clear();
  BOOST_LOG_TRIVIAL(debug) << "Request parser: Read notification type "
                           << request_.notification_types.size() << " of " << notification_count_;

  if (request_.notification_types.size() < notification_count_) {
    return State::READING_NOTIFICATION_HEADERS;
  }
  return after_notifications();
}

RequestParser::State RequestParser::on_resource_header() {
  const std::string line = next_line();
  if (!line.empty()) {
    parse_header(line, current_block_);
    return State::READING_RESOURCE_HEADERS;
  }

  // Extra blank line between resources
  if (current_block_.empty()) {
    return State::READING_RESOURCE_HEADERS;
  }
  return State::READING_RESOURCE_DATA;
}

RequestParser::State RequestParser::on_resource_data() {
  auto identifier = current_block_.get(headers::RESOURCE_IDENTIFIER);
  if (identifier && request_.resources.find(*identifier)) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Duplicate resource: " + *identifier);
  }

  if (request_.ignored) {
    BOOST_LOG_TRIVIAL(debug) << "Request parser: Discarding resource "
                             << identifier.value_or("") << " of ignored request";
  }
  store::ResourceStore& target = request_.ignored ? static_cast<store::ResourceStore&>(discard_store_) : store_;
  ResourceReader resource_reader(reader_, encryption_, target);
  request_.resources.attach(resource_reader.read(current_block_));
  current_block_.clear();

  if (request_.resources.has_pending()) {
    BOOST_LOG_TRIVIAL(debug) << "Request parser: " << request_.resources.pending_count()
                             << " resources still pending";
    return State::READING_RESOURCE_HEADERS;
  }
  return State::END_OF_REQUEST;
}

RequestParser::State RequestParser::after_notifications() const {
  if (request_.resources.has_pending()) {
    return State::READING_RESOURCE_HEADERS;
  }
  return State::END_OF_REQUEST;
}

//==============================================
// UTILITY METHODS
//==============================================

std::string RequestParser::next_line() {
  std::string line;
  if (!reader_.read_line(line)) {
    throw EndOfStream("while " + state_to_string(state_));
  }
  return line;
}

void RequestParser::record_header(const std::string& line, HeaderBlock& block) {
  const auto entry = parse_header(line, block);
  if (auto identifier = resource_reference(entry.second)) {
    request_.resources.reference(*identifier);
  }
}

void RequestParser::configure_encryption(const RequestLine& request_line, std::vector<uint8_t> key) {
  if (request_line.encryption == crypto::Algorithm::NONE) {
    return;
  }

  if (key.empty()) {
    throw GntpException(ErrorCode::NOT_AUTHORIZED,
                        std::string("Encryption ") + crypto::algorithm_to_string(request_line.encryption) +
                        " requires a password");
  }

  try {
    encryption_ = EncryptionLayer(request_line.encryption, std::move(key), request_line.iv);
  } catch (const crypto::InitializationError& e) {
    throw GntpException(ErrorCode::INVALID_REQUEST, e.what());
  }
}

std::string RequestParser::state_to_string(State state) {
  switch (state) {
    case State::CONNECTED:                    return "CONNECTED";
    case State::READING_REQUEST_HEADERS:      return "READING_REQUEST_HEADERS";
    case State::READING_NOTIFICATION_HEADERS: return "READING_NOTIFICATION_HEADERS";
    case State::READING_RESOURCE_HEADERS:     return "READING_RESOURCE_HEADERS";
    case State::READING_RESOURCE_DATA:        return "READING_RESOURCE_DATA";
    case State::END_OF_REQUEST:               return "END_OF_REQUEST";
    case State::RESPONSE_SENT:                return "RESPONSE_SENT";
    default:                                  return "UNKNOWN";
  }
}

} // namespace protocol
} // namespace gntp
