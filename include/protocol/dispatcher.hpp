#ifndef GNTP_PROTOCOL_DISPATCHER_HPP
#define GNTP_PROTOCOL_DISPATCHER_HPP

#include "protocol/request.hpp"
#include "protocol/response.hpp"
#include "registry/notification_sink.hpp"
#include "registry/registry.hpp"

namespace gntp {
namespace protocol {

/**
 * Dispatcher applies a completed request to the registry and the
 * notification sink and builds the OK response.
 * Failures are thrown as GntpException and mapped by the caller.
 */
class Dispatcher {
public:
  Dispatcher(registry::Registry& registry, registry::NotificationSink& sink);

  Response dispatch(const PendingRequest& request);

private:
  registry::Registry& registry_;
  registry::NotificationSink& sink_;

  Response handle_register(const PendingRequest& request);
  Response handle_notify(const PendingRequest& request);
  Response handle_subscribe(const PendingRequest& request);

  // Throws GntpException(INVALID_REQUEST) if a referenced resource never arrived
  static void verify_resources(const PendingRequest& request);
  static std::string required_header(const HeaderBlock& block, const char* key);
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_DISPATCHER_HPP
