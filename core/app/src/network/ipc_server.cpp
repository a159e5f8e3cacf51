#include "kds/network/ipc_server.hpp"
#include "kds/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace kds {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (thread_.joinable()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);
  cmd->set(zmq::sockopt::linger, 0);
  pub->set(zmq::sockopt::linger, 0);
  cmd->bind(cmd_endpoint_);
  pub->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(cmd);
  pub_socket_ = std::move(pub);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. commands=" << commands_served_.load()
            << " events=" << events_published_.load() << "\n";
}

void IpcServer::pushTelemetry(Event event) { outbox_.push(std::move(event)); }

void IpcServer::run() {
  while (running_.load()) {
    publishPending();
    if (waitForCommand()) {
      serveCommand();
    }
  }
  publishPending();
}

// -----------------------------------------------------------------------------
// publishPending(): topic frame, then body frame
// -----------------------------------------------------------------------------
void IpcServer::publishPending() {
  for (const Event& event : outbox_.drain()) {
    auto body = formatTelemetry(event);
    if (!body) {
      continue;
    }
    const std::string topic = telemetryTopic(event);
    if (pub_socket_->send(zmq::buffer(topic), zmq::send_flags::sndmore) &&
        pub_socket_->send(zmq::buffer(*body), zmq::send_flags::dontwait)) {
      events_published_.fetch_add(1);
    }
  }
}

bool IpcServer::waitForCommand() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};
  try {
    zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return false;
    }
    throw;
  }
  return (items[0].revents & ZMQ_POLLIN) != 0;
}

// -----------------------------------------------------------------------------
// serveCommand(): REP must answer every request, even when the handler throws
// -----------------------------------------------------------------------------
void IpcServer::serveCommand() {
  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  std::string reply;
  try {
    reply = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command handler threw: " << e.what()
              << "\n";
    nlohmann::json error{{"status", "error"},
                         {"error", "internal"},
                         {"message", e.what()}};
    reply = error.dump();
  }

  if (!cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none)) {
    std::cerr << "[IpcServer] WARNING: reply not sent\n";
    return;
  }
  commands_served_.fetch_add(1);
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto j = eventToJson(event)) {
    return j->dump();
  }
  return std::nullopt;
}

std::string IpcServer::telemetryTopic(const Event& event) {
  const char* type = std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TicketUpdateEvent>) {
          return "ticket_update";
        } else if constexpr (std::is_same_v<T, EscalationEvent>) {
          return "escalation";
        } else {
          return "order_routed";
        }
      },
      event);
  return hubOf(event) + "/" + type;
}

}  // namespace kds
