#pragma once

#include "staged/events/notification.hpp"

namespace staged {

// -----------------------------------------------------------------------------
// INotificationSink
// -----------------------------------------------------------------------------
// notify() must not block the caller for long and must not throw; delivery
// failures are the sink's to log. The orchestrator still guards each call.
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;

  virtual void notify(const Notification& notification) = 0;
};

}  // namespace staged
