#include "protocol/protocol_engine.hpp"
#include "protocol/line_reader.hpp"
#include "protocol/request_parser.hpp"
#include <optional>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

ProtocolEngine::ProtocolEngine(registry::Registry& registry,
                               registry::NotificationSink& sink,
                               store::ResourceStore& store,
                               EngineOptions options)
  : registry_(registry)
  , sink_(sink)
  , store_(store)
  , options_(std::move(options))
  , authenticator_(registry_, options_.auth_failure_policy) {}

bool ProtocolEngine::handle(std::istream& input, std::ostream& output, std::uint64_t connection_id) {
  LineReader reader(input);
  RequestParser parser(reader, authenticator_, store_);

  std::optional<Response> response;
  try {
    std::optional<PendingRequest> request = parser.parse();
    if (!request) {
      BOOST_LOG_TRIVIAL(info) << "Connection " << connection_id << ": Closed before request was complete";
      return false;
    }

    Dispatcher dispatcher(registry_, sink_);
    response = dispatcher.dispatch(*request);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection " << connection_id << ": Request failed in state "
                             << parser.get_state() << ": " << e.what();
    response = map_exception(e);
  }

  response->add_origin_headers(options_.origin);
  response->write(output);
  parser.mark_response_sent();

  if (!output) {
    BOOST_LOG_TRIVIAL(warning) << "Connection " << connection_id << ": Failed to write response";
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Connection " << connection_id << ": Sent "
                             << (response->get_type() == ResponseType::OK ? "OK" : "ERROR")
                             << " response after " << reader.bytes_consumed() << " bytes";
  }
  return true;
}

} // namespace protocol
} // namespace gntp
