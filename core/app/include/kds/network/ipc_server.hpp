#pragma once

#include "kds/concurrent/thread_safe_queue.hpp"
#include "kds/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace kds {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoint for kitchen displays
// -----------------------------------------------------------------------------
//
// @brief  Serves JSON commands from display clients on a REP socket and
//         broadcasts kitchen telemetry on a PUB socket.
//
// @details
// Owns no kitchen logic. Every request string goes to the command handler
// (KitchenEngine::executeCommand) and its reply is sent back unchanged.
//
//   REP socket (default tcp://127.0.0.1:5556)
//     One JSON command per request, e.g.
//       {"cmd":"transition","ticket_id":7,"trigger":"bump","actor":"grill-1"}
//
//   PUB socket (default tcp://127.0.0.1:5557)
//     Two frames per event: a topic "<hub_id>/<type>" and the JSON body.
//     A station screen subscribes with the prefix "h1/" to get one hub, or
//     "h1/escalation" for escalations only.
//
// Thread model:
//   start() binds both sockets and spawns the worker; stop() joins it and
//   closes the sockets. The command handler runs on the worker thread.
//   pushTelemetry() is safe from any thread (the notification loop calls it).
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;

  // Throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Idempotent. Queued telemetry is published before the sockets close.
  void stop();

  void pushTelemetry(Event event);

  // JSON body for a telemetry event, or nullopt if it is not published.
  static std::optional<std::string> formatTelemetry(const Event& event);

  // "<hub_id>/<type>", the subscription prefix displays filter on.
  static std::string telemetryTopic(const Event& event);

  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t eventsPublished() const { return events_published_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  bool waitForCommand();
  void serveCommand();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> outbox_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> events_published_{0};
};

}  // namespace kds
