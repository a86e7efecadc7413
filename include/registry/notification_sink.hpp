#ifndef GNTP_REGISTRY_NOTIFICATION_SINK_HPP
#define GNTP_REGISTRY_NOTIFICATION_SINK_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include "registry/registry.hpp"
#include "protocol/resource.hpp"

namespace gntp {
namespace registry {

// A decoded notification ready for presentation
struct Notification {
  Application application;
  NotificationType type;
  std::string id;
  std::string title;
  std::string text;
  std::string icon;
  bool sticky = false;
  int priority = 0;
  std::string coalescing_id;
  std::vector<protocol::Resource> resources;
  std::chrono::system_clock::time_point timestamp;
};

// Presents notifications to the user
class NotificationSink {
public:
  virtual ~NotificationSink() = default;
  virtual void display(const Notification& notification) = 0;

protected:
  NotificationSink() = default;
};

// Presents notifications by writing them to the log
class LogNotificationSink : public NotificationSink {
public:
  void display(const Notification& notification) override;

  std::size_t displayed_count() const { return displayed_count_; }

private:
  std::atomic<std::size_t> displayed_count_{0};
};

} // namespace registry
} // namespace gntp

#endif // GNTP_REGISTRY_NOTIFICATION_SINK_HPP
