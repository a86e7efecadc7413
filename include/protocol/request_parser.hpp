#ifndef GNTP_PROTOCOL_REQUEST_PARSER_HPP
#define GNTP_PROTOCOL_REQUEST_PARSER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "protocol/authenticator.hpp"
#include "protocol/encryption_layer.hpp"
#include "protocol/line_reader.hpp"
#include "protocol/request.hpp"
#include "store/memory_store.hpp"
#include "store/resource_store.hpp"

namespace gntp {
namespace protocol {

/**
 * RequestParser sequences the parsing phases of a single GNTP request.
 * One transition function per state; each consumes input and returns the
 * next state until END_OF_REQUEST is reached.
 */
class RequestParser {
public:
  /**
   * Parsing phases:
   * CONNECTED                    - Waiting for the request line
   * READING_REQUEST_HEADERS      - Top-level header block
   * READING_NOTIFICATION_HEADERS - One block per declared notification type (REGISTER)
   * READING_RESOURCE_HEADERS     - Identifier and Length of the next resource
   * READING_RESOURCE_DATA        - Binary payload plus its trailing blank line
   * END_OF_REQUEST               - Request complete, ready for dispatch
   * RESPONSE_SENT                - A response went out; the connection may close
   */
  enum class State {
    CONNECTED,
    READING_REQUEST_HEADERS,
    READING_NOTIFICATION_HEADERS,
    READING_RESOURCE_HEADERS,
    READING_RESOURCE_DATA,
    END_OF_REQUEST,
    RESPONSE_SENT
  };

  // Delete copy constructor and assignment operator
  RequestParser(const RequestParser&) = delete;
  RequestParser& operator=(const RequestParser&) = delete;


  // ---- CONSTRUCTOR ----
  RequestParser(LineReader& reader, const Authenticator& authenticator, store::ResourceStore& store);


  // ---- PARSING ----
  /**
   * Runs the state machine to END_OF_REQUEST.
   * @return the parsed request, or std::nullopt if the stream ended first
   * @throws GntpException, crypto::DecryptionError on malformed input
   */
  std::optional<PendingRequest> parse();


  // ---- GETTERS AND SETTERS ----
  State get_state() const { return state_; }
  void mark_response_sent() { state_ = State::RESPONSE_SENT; }

  static std::string state_to_string(State state);

private:
  // ---- PARAMETERS ----
  LineReader& reader_;
  const Authenticator& authenticator_;
  store::ResourceStore& store_;
  // Takes the payloads of ignored requests so they never reach store_
  store::DiscardStore discard_store_;

  State state_ = State::CONNECTED;
  PendingRequest request_;
  EncryptionLayer encryption_;

  // Block being accumulated in the current phase
  HeaderBlock current_block_;
  std::uint64_t notification_count_ = 0;


  // ---- STATE TRANSITIONS ----
  State on_connected();
  State on_request_header();
  State on_notification_header();
  State on_resource_header();
  State on_resource_data();
  // Decides what follows the request headers or the last notification block
  State after_notifications() const;


  // ---- UTILITY METHODS ----
  // Throws EndOfStream when the stream has ended
  std::string next_line();
  // Parses a header into block and registers any resource it references
  void record_header(const std::string& line, HeaderBlock& block);
  void configure_encryption(const RequestLine& request_line, std::vector<uint8_t> key);
};

// Stream operator for RequestParser::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const RequestParser::State& state) {
  os << RequestParser::state_to_string(state);
  return os;
}

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_REQUEST_PARSER_HPP
