#include "registry/notification_sink.hpp"
#include <boost/log/trivial.hpp>

namespace gntp {
namespace registry {

void LogNotificationSink::display(const Notification& notification) {
  ++displayed_count_;

  BOOST_LOG_TRIVIAL(info) << "Notification: [" << notification.application.name << "/"
                          << notification.type.display_name << "] " << notification.title
                          << (notification.text.empty() ? "" : " - " + notification.text)
                          << (notification.sticky ? " (sticky)" : "")
                          << " priority=" << notification.priority;

  for (const auto& resource : notification.resources) {
    BOOST_LOG_TRIVIAL(debug) << "Notification: Resource " << resource.identifier << " ("
                             << resource.length << " bytes) at "
                             << (resource.location.empty() ? "<discarded>" : resource.location);
  }
}

} // namespace registry
} // namespace gntp
