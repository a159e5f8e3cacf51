#include "kds/concurrent/notification_loop.hpp"

#include <iostream>

namespace kds {

NotificationLoop::~NotificationLoop() { stop(); }

void NotificationLoop::start() {
  if (thread_.joinable()) {
    return;
  }
  pending_.reopen();
  thread_ = std::thread([this] { run(); });
}

void NotificationLoop::stop() {
  if (!thread_.joinable()) {
    return;
  }
  pending_.close();
  thread_.join();

  std::cout << "[NotificationLoop] stopped after " << published_.load()
            << " events.\n";
}

// pop() only returns nullopt once close() was called and the queue is empty.
void NotificationLoop::run() {
  while (std::optional<Event> event = pending_.pop()) {
    bus_.publish(*event);
    published_.fetch_add(1);
  }
}

}  // namespace kds
