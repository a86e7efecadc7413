#ifndef GNTP_PROTOCOL_CONSTANTS_HPP
#define GNTP_PROTOCOL_CONSTANTS_HPP

#include <optional>
#include <string>

namespace gntp {
namespace protocol {

constexpr const char* SUPPORTED_PROTOCOL = "GNTP";
constexpr const char* SUPPORTED_PROTOCOL_VERSION = "1.0";
constexpr const char* RESOURCE_URI_PREFIX = "x-growl-resource://";
constexpr const char* LINE_TERMINATOR = "\r\n";

// Seconds; only sent with a SUBSCRIBE OK response
constexpr const char* SUBSCRIPTION_TTL = "300";

constexpr const char* RESPONSE_OK = "-OK";
constexpr const char* RESPONSE_ERROR = "-ERROR";

namespace headers {
  constexpr const char* APPLICATION_NAME = "Application-Name";
  constexpr const char* APPLICATION_ICON = "Application-Icon";
  constexpr const char* NOTIFICATIONS_COUNT = "Notifications-Count";

  constexpr const char* NOTIFICATION_NAME = "Notification-Name";
  constexpr const char* NOTIFICATION_DISPLAY_NAME = "Notification-Display-Name";
  constexpr const char* NOTIFICATION_ENABLED = "Notification-Enabled";
  constexpr const char* NOTIFICATION_ICON = "Notification-Icon";
  constexpr const char* NOTIFICATION_ID = "Notification-ID";
  constexpr const char* NOTIFICATION_TITLE = "Notification-Title";
  constexpr const char* NOTIFICATION_TEXT = "Notification-Text";
  constexpr const char* NOTIFICATION_STICKY = "Notification-Sticky";
  constexpr const char* NOTIFICATION_PRIORITY = "Notification-Priority";
  constexpr const char* NOTIFICATION_COALESCING_ID = "Notification-Coalescing-ID";

  constexpr const char* RESOURCE_IDENTIFIER = "Identifier";
  constexpr const char* RESOURCE_LENGTH = "Length";

  constexpr const char* RESPONSE_ACTION = "Response-Action";
  constexpr const char* ERROR_CODE = "Error-Code";
  constexpr const char* ERROR_DESCRIPTION = "Error-Description";
  constexpr const char* SUBSCRIPTION_TTL = "Subscription-TTL";

  constexpr const char* ORIGIN_MACHINE_NAME = "Origin-Machine-Name";
  constexpr const char* ORIGIN_SOFTWARE_NAME = "Origin-Software-Name";
  constexpr const char* ORIGIN_SOFTWARE_VERSION = "Origin-Software-Version";
  constexpr const char* ORIGIN_PLATFORM_NAME = "Origin-Platform-Name";
  constexpr const char* ORIGIN_PLATFORM_VERSION = "Origin-Platform-Version";
} // namespace headers

// Message types a request line may carry
enum class MessageType {
  REGISTER,
  NOTIFY,
  SUBSCRIBE
};

inline std::optional<MessageType> message_type_from_string(const std::string& name) {
  if (name == "REGISTER")  return MessageType::REGISTER;
  if (name == "NOTIFY")    return MessageType::NOTIFY;
  if (name == "SUBSCRIBE") return MessageType::SUBSCRIBE;
  return std::nullopt;
}

inline const char* message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::REGISTER:  return "REGISTER";
    case MessageType::NOTIFY:    return "NOTIFY";
    case MessageType::SUBSCRIBE: return "SUBSCRIBE";
  }
  return "UNKNOWN";
}

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_CONSTANTS_HPP
