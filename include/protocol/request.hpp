#ifndef GNTP_PROTOCOL_REQUEST_HPP
#define GNTP_PROTOCOL_REQUEST_HPP

#include <chrono>
#include <string>
#include <vector>
#include "protocol/constants.hpp"
#include "protocol/header_block.hpp"
#include "protocol/resource.hpp"

namespace gntp {
namespace protocol {

// One notification type declared by a REGISTER request
struct NotificationTypeSpec {
  std::string name;
  std::string display_name;
  bool enabled = false;
  std::string icon;

  // Display name defaults to the name. Throws GntpException(INVALID_REQUEST)
  // when Notification-Name is missing.
  static NotificationTypeSpec from_headers(const HeaderBlock& block);
};

// Parses GNTP booleans: "true" and "yes" in any case
bool parse_bool(const std::string& value);

// A fully parsed request, ready for dispatch
struct PendingRequest {
  MessageType message_type = MessageType::NOTIFY;
  // Unauthenticated NOTIFY accepted under the ignore policy; never dispatched
  bool ignored = false;
  HeaderBlock headers;
  std::vector<NotificationTypeSpec> notification_types;
  ResourceArena resources;
  std::chrono::system_clock::time_point received_at;
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_REQUEST_HPP
