#ifndef GNTP_PROTOCOL_PROTOCOL_ENGINE_HPP
#define GNTP_PROTOCOL_PROTOCOL_ENGINE_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include "protocol/authenticator.hpp"
#include "protocol/dispatcher.hpp"
#include "protocol/response.hpp"
#include "registry/notification_sink.hpp"
#include "registry/registry.hpp"
#include "store/resource_store.hpp"

namespace gntp {
namespace protocol {

struct EngineOptions {
  AuthFailurePolicy auth_failure_policy = AuthFailurePolicy::REJECT;
  OriginInfo origin;
};

/**
 * Handles one request per call on a connection's streams. Every failure is
 * turned into exactly one ERROR response; nothing escapes to the caller.
 * Safe to share between connection threads.
 */
class ProtocolEngine {
public:
  ProtocolEngine(registry::Registry& registry,
                 registry::NotificationSink& sink,
                 store::ResourceStore& store,
                 EngineOptions options = EngineOptions());

  /**
   * Reads one request from input and writes its response to output.
   * @return false if the stream ended before the request was complete and
   *         no response was written
   */
  bool handle(std::istream& input, std::ostream& output, std::uint64_t connection_id = 0);

private:
  registry::Registry& registry_;
  registry::NotificationSink& sink_;
  store::ResourceStore& store_;
  const EngineOptions options_;
  const Authenticator authenticator_;
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_PROTOCOL_ENGINE_HPP
