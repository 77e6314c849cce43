#pragma once

#include "staged/concurrent/thread_safe_queue.hpp"
#include "staged/events/notification.hpp"
#include "staged/gateway/i_notification_sink.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace staged {

// -----------------------------------------------------------------------------
// IpcServer — operator commands and notification publisher
// -----------------------------------------------------------------------------
//
// @brief  Owns a dedicated thread with two ZeroMQ sockets: a REP socket that
//         answers operator commands, and a PUB socket that broadcasts
//         notifications as JSON.
//
// @details
// Commands ("PING", "STATUS", "HALT", "RESUME", "CYCLE") arrive as plain
// strings and are answered by the CommandHandler supplied at construction;
// the handler runs on the IPC thread and must only touch thread-safe engine
// state.
//
// As an INotificationSink, notify() only enqueues. The IPC thread drains the
// queue between command polls and publishes each notification with
// dontwait, so a slow or absent subscriber can never stall the trading
// cycle. Published messages look like:
//
//   {"type":"trade_executed","code":"005930","side":"Buy",...}
//   {"type":"risk_alert","severity":"CRITICAL","message":"..."}
//   {"type":"cycle_summary","cycle_id":12,...}
//
// Socket lifecycle:
//   Sockets are created in start() and destroyed in stop(). The context and
//   sockets are only touched by the IPC thread once it is running.
//
// Thread model:
//   notify() may be called from any thread. Everything else runs on the
//   IPC thread.
// -----------------------------------------------------------------------------
class IpcServer final : public INotificationSink {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer() override;

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  /// Binds both sockets and spawns the IPC thread. Throws zmq::error_t when
  /// an endpoint cannot be bound.
  void start();

  /// Stops the thread after a final drain of queued notifications.
  void stop();

  void notify(const Notification& notification) override;

  /// JSON wire form of a notification.
  static std::string formatNotification(const Notification& notification);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processNotifications();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Notification> outbox_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace staged
