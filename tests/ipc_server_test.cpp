// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for staged::IpcServer.
//
// Validates:
//   - formatNotification() emits one typed JSON object per notification
//   - A REQ client gets the command handler's reply
//   - A throwing handler still gets an error reply (REP never wedges)
//   - Notifications queued with notify() reach a SUB client
//
// Sockets bind to high localhost ports that no other test uses.
// =============================================================================

#include "staged/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using nlohmann::json;

namespace {

std::string request(zmq::context_t& ctx, const std::string& endpoint,
                    const std::string& cmd) {
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(endpoint);
  req.send(zmq::buffer(cmd), zmq::send_flags::none);

  zmq::message_t reply;
  auto result = req.recv(reply, zmq::recv_flags::none);
  if (!result) {
    return "<timeout>";
  }
  return reply.to_string();
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Wire format of each notification type.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, TradeExecuted) {
  staged::TradeExecutedEvent e;
  e.fill = {"PAPER-3", "005930", staged::domain::Side::Sell, 81000.0, 4, 1234};
  e.stage_number = 2;
  e.reason = "PROFIT_TARGET";
  e.realized_pnl = 12000.0;

  const json j = json::parse(staged::IpcServer::formatNotification(e));
  EXPECT_EQ(j.at("type"), "trade_executed");
  EXPECT_EQ(j.at("order_id"), "PAPER-3");
  EXPECT_EQ(j.at("side"), "Sell");
  EXPECT_EQ(j.at("quantity"), 4);
  EXPECT_EQ(j.at("stage"), 2);
  EXPECT_DOUBLE_EQ(j.at("realized_pnl").get<double>(), 12000.0);
}

TEST(IpcServerFormatTest, RiskAlertAndSummary) {
  staged::RiskAlertEvent alert{staged::AlertSeverity::Critical, "",
                               "ledger save failed", 99};
  json j = json::parse(staged::IpcServer::formatNotification(alert));
  EXPECT_EQ(j.at("type"), "risk_alert");
  EXPECT_EQ(j.at("severity"), "CRITICAL");
  EXPECT_EQ(j.at("message"), "ledger save failed");

  staged::CycleSummaryEvent summary;
  summary.cycle_id = 12;
  summary.entries_suppressed = true;
  summary.breaker_reasons = {"operator halt"};
  summary.commit_pending = true;
  j = json::parse(staged::IpcServer::formatNotification(summary));
  EXPECT_EQ(j.at("type"), "cycle_summary");
  EXPECT_EQ(j.at("cycle_id"), 12);
  EXPECT_TRUE(j.at("entries_suppressed").get<bool>());
  EXPECT_EQ(j.at("breaker_reasons").at(0), "operator halt");
  EXPECT_TRUE(j.at("commit_pending").get<bool>());
}

// -----------------------------------------------------------------------------
// 2. Commands round-trip; handler exceptions become error replies.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, CommandsRoundTrip) {
  const std::string cmd_ep = "tcp://127.0.0.1:57601";
  staged::IpcServer server(
      [](const std::string& cmd) -> std::string {
        if (cmd == "BOOM") {
          throw std::runtime_error("handler failed");
        }
        return json{{"status", "ok"}, {"response", cmd}}.dump();
      },
      cmd_ep, "tcp://127.0.0.1:57602");
  server.start();

  zmq::context_t ctx(1);
  json reply = json::parse(request(ctx, cmd_ep, "PING"));
  EXPECT_EQ(reply.at("status"), "ok");
  EXPECT_EQ(reply.at("response"), "PING");

  reply = json::parse(request(ctx, cmd_ep, "BOOM"));
  EXPECT_EQ(reply.at("status"), "error");

  // Still answering after the failure.
  reply = json::parse(request(ctx, cmd_ep, "STATUS"));
  EXPECT_EQ(reply.at("response"), "STATUS");

  server.stop();
}

// -----------------------------------------------------------------------------
// 3. notify() output reaches a subscriber.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, NotificationsArePublished) {
  const std::string pub_ep = "tcp://127.0.0.1:57604";
  staged::IpcServer server([](const std::string&) { return std::string("{}"); },
                           "tcp://127.0.0.1:57603", pub_ep);
  server.start();

  zmq::context_t ctx(1);
  zmq::socket_t sub(ctx, zmq::socket_type::sub);
  sub.set(zmq::sockopt::subscribe, "");
  sub.set(zmq::sockopt::rcvtimeo, 200);
  sub.set(zmq::sockopt::linger, 0);
  sub.connect(pub_ep);

  // PUB drops messages until the subscription propagates; keep publishing
  // until one arrives.
  staged::CycleSummaryEvent summary;
  summary.cycle_id = 5;
  bool received = false;
  for (int attempt = 0; attempt < 25 && !received; ++attempt) {
    server.notify(summary);
    zmq::message_t msg;
    if (sub.recv(msg, zmq::recv_flags::none)) {
      const json j = json::parse(msg.to_string());
      EXPECT_EQ(j.at("type"), "cycle_summary");
      EXPECT_EQ(j.at("cycle_id"), 5);
      received = true;
    }
  }
  EXPECT_TRUE(received) << "no notification reached the subscriber";

  server.stop();
}
