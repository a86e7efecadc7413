#include "protocol/dispatcher.hpp"
#include "protocol/gntp_error.hpp"
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

Dispatcher::Dispatcher(registry::Registry& registry, registry::NotificationSink& sink)
  : registry_(registry)
  , sink_(sink) {}

Response Dispatcher::dispatch(const PendingRequest& request) {
  if (request.ignored) {
    BOOST_LOG_TRIVIAL(warning) << "Dispatcher: Ignoring unauthorized "
                               << message_type_to_string(request.message_type) << " from \""
                               << request.headers.get_or(headers::APPLICATION_NAME, "") << "\"";
    Response response = Response::ok(request.message_type);
    if (request.message_type == MessageType::NOTIFY) {
      response.add_header(headers::NOTIFICATION_ID, request.headers.get_or(headers::NOTIFICATION_ID, ""));
    }
    return response;
  }

  verify_resources(request);

  switch (request.message_type) {
    case MessageType::REGISTER:  return handle_register(request);
    case MessageType::NOTIFY:    return handle_notify(request);
    case MessageType::SUBSCRIBE: return handle_subscribe(request);
  }
  throw GntpException(ErrorCode::INTERNAL_SERVER_ERROR, "Unhandled message type");
}

//==============================================
// MESSAGE HANDLERS
//==============================================

Response Dispatcher::handle_register(const PendingRequest& request) {
  const std::string application_name = required_header(request.headers, headers::APPLICATION_NAME);
  const std::string icon = request.headers.get_or(headers::APPLICATION_ICON, "");

  const registry::Application application = registry_.register_application(application_name, icon);
  for (const auto& spec : request.notification_types) {
    registry_.register_notification_type(application, spec.name, spec.display_name, spec.enabled, spec.icon);
  }

  BOOST_LOG_TRIVIAL(info) << "Dispatcher: Registered \"" << application_name << "\" with "
                          << request.notification_types.size() << " notification types";
  return Response::ok(MessageType::REGISTER);
}

Response Dispatcher::handle_notify(const PendingRequest& request) {
  const std::string application_name = required_header(request.headers, headers::APPLICATION_NAME);
  const std::string type_name = required_header(request.headers, headers::NOTIFICATION_NAME);

  auto application = registry_.resolve_application(application_name);
  if (!application) {
    throw GntpException(ErrorCode::UNKNOWN_APPLICATION, application_name);
  }
  auto type = registry_.resolve_notification_type(*application, type_name);
  if (!type) {
    throw GntpException(ErrorCode::UNKNOWN_NOTIFICATION, type_name);
  }

  registry::Notification notification;
  notification.application = *application;
  notification.type = *type;
  notification.id = request.headers.get_or(headers::NOTIFICATION_ID, "");
  notification.title = request.headers.get_or(headers::NOTIFICATION_TITLE, "");
  notification.text = request.headers.get_or(headers::NOTIFICATION_TEXT, "");
  notification.icon = request.headers.get_or(headers::NOTIFICATION_ICON, type->icon);
  notification.sticky = parse_bool(request.headers.get_or(headers::NOTIFICATION_STICKY, ""));
  notification.coalescing_id = request.headers.get_or(headers::NOTIFICATION_COALESCING_ID, "");
  notification.resources = request.resources.attached();
  notification.timestamp = request.received_at;

  const std::string priority = request.headers.get_or(headers::NOTIFICATION_PRIORITY, "0");
  if (!boost::conversion::try_lexical_convert(priority, notification.priority)) {
    BOOST_LOG_TRIVIAL(warning) << "Dispatcher: Invalid priority \"" << priority << "\", using 0";
    notification.priority = 0;
  }

  if (type->enabled) {
    sink_.display(notification);
  } else {
    BOOST_LOG_TRIVIAL(info) << "Dispatcher: Notification type \"" << type_name << "\" of \""
                            << application_name << "\" is disabled, not displaying";
  }

  Response response = Response::ok(MessageType::NOTIFY);
  response.add_header(headers::NOTIFICATION_ID, notification.id);
  return response;
}

Response Dispatcher::handle_subscribe(const PendingRequest& /*request*/) {
  throw GntpException(ErrorCode::INTERNAL_SERVER_ERROR, "SUBSCRIBE is not supported");
}

//==============================================
// UTILITY METHODS
//==============================================

void Dispatcher::verify_resources(const PendingRequest& request) {
  if (request.resources.has_pending()) {
    throw GntpException(ErrorCode::INVALID_REQUEST,
                        std::to_string(request.resources.pending_count()) + " referenced resources missing");
  }
}

std::string Dispatcher::required_header(const HeaderBlock& block, const char* key) {
  auto value = block.get(key);
  if (!value || value->empty()) {
    throw GntpException(ErrorCode::INVALID_REQUEST, std::string("Missing ") + key + " header");
  }
  return *value;
}

} // namespace protocol
} // namespace gntp
