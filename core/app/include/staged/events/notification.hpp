#pragma once

#include "staged/domain/order_fill.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace staged {

// -----------------------------------------------------------------------------
// Notification types
// -----------------------------------------------------------------------------
//
// @brief  Plain structs handed to INotificationSink after a cycle.
//
// @details
// Notifications are fire-and-forget: the cycle never waits on delivery and
// a failed delivery is logged, not retried. Content is informational only;
// nothing reads a notification back as state.
// -----------------------------------------------------------------------------

/// A confirmed fill applied to a ledger.
struct TradeExecutedEvent {
  domain::OrderFill fill;
  int stage_number{0};
  std::string reason;        // close reason for sells, "ENTRY" for buys
  double realized_pnl{0.0};  // sells only
};

enum class AlertSeverity {
  Warning,
  Critical,
};

/// Something an operator should look at: rejected order, isolated
/// instrument, tripped breaker, persistence failure.
struct RiskAlertEvent {
  AlertSeverity severity{AlertSeverity::Warning};
  std::string code;  // empty for engine-wide alerts
  std::string message;
  std::int64_t timestamp_ms{0};
};

/// One per completed pass.
struct CycleSummaryEvent {
  std::int64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  int instruments_evaluated{0};
  int orders_placed{0};
  int fills_applied{0};
  bool entries_suppressed{false};
  std::vector<std::string> breaker_reasons;
  double effective_budget{0.0};
  bool commit_pending{false};
};

using Notification =
    std::variant<TradeExecutedEvent, RiskAlertEvent, CycleSummaryEvent>;

inline const char* alertSeverityToString(AlertSeverity s) {
  switch (s) {
    case AlertSeverity::Warning:  return "WARNING";
    case AlertSeverity::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

}  // namespace staged
