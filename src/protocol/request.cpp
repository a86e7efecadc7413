#include "protocol/request.hpp"
#include "protocol/gntp_error.hpp"
#include <boost/algorithm/string/predicate.hpp>

namespace gntp {
namespace protocol {

bool parse_bool(const std::string& value) {
  return boost::algorithm::iequals(value, "true") || boost::algorithm::iequals(value, "yes");
}

NotificationTypeSpec NotificationTypeSpec::from_headers(const HeaderBlock& block) {
  auto name = block.get(headers::NOTIFICATION_NAME);
  if (!name || name->empty()) {
    throw GntpException(ErrorCode::INVALID_REQUEST,
                        std::string("Notification type without ") + headers::NOTIFICATION_NAME);
  }

  NotificationTypeSpec spec;
  spec.name = *name;
  spec.display_name = block.get_or(headers::NOTIFICATION_DISPLAY_NAME, "");
  if (spec.display_name.empty()) {
    spec.display_name = spec.name;
  }
  spec.enabled = parse_bool(block.get_or(headers::NOTIFICATION_ENABLED, ""));
  spec.icon = block.get_or(headers::NOTIFICATION_ICON, "");
  return spec;
}

} // namespace protocol
} // namespace gntp
