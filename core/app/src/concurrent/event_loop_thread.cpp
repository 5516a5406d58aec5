#include "tranche/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace tranche {

namespace {

constexpr auto kPopTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.pop_for(kPopTimeout)) {
      bus_.publish(*event);
    }
  }
}

}  // namespace tranche
