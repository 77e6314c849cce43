#include "staged/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace staged {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::notify(const Notification& notification) {
  outbox_.push(notification);
}

void IpcServer::run() {
  while (running_.load()) {
    processNotifications();
    processCommands();
  }
  // Final drain before shutdown.
  processNotifications();
}

void IpcServer::processNotifications() {
  for (const auto& notification : outbox_.drain()) {
    const std::string payload = formatNotification(notification);
    zmq::message_t msg(payload.data(), payload.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: notification dropped (PUB busy)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    // A REP socket must answer every request or it stays wedged.
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    response =
        nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatNotification(): one JSON object per notification type
// -----------------------------------------------------------------------------
std::string IpcServer::formatNotification(const Notification& notification) {
  nlohmann::json j;
  if (auto* e = std::get_if<TradeExecutedEvent>(&notification)) {
    j["type"] = "trade_executed";
    j["order_id"] = e->fill.order_id;
    j["code"] = e->fill.code;
    j["side"] = domain::sideToString(e->fill.side);
    j["price"] = e->fill.price;
    j["quantity"] = e->fill.quantity;
    j["timestamp_ms"] = e->fill.timestamp_ms;
    j["stage"] = e->stage_number;
    j["reason"] = e->reason;
    j["realized_pnl"] = e->realized_pnl;
  } else if (auto* e = std::get_if<RiskAlertEvent>(&notification)) {
    j["type"] = "risk_alert";
    j["severity"] = alertSeverityToString(e->severity);
    j["code"] = e->code;
    j["message"] = e->message;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (auto* e = std::get_if<CycleSummaryEvent>(&notification)) {
    j["type"] = "cycle_summary";
    j["cycle_id"] = e->cycle_id;
    j["timestamp_ms"] = e->timestamp_ms;
    j["instruments_evaluated"] = e->instruments_evaluated;
    j["orders_placed"] = e->orders_placed;
    j["fills_applied"] = e->fills_applied;
    j["entries_suppressed"] = e->entries_suppressed;
    j["breaker_reasons"] = e->breaker_reasons;
    j["effective_budget"] = e->effective_budget;
    j["commit_pending"] = e->commit_pending;
  }
  return j.dump();
}

}  // namespace staged
