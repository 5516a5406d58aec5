#pragma once

#include "tranche/concurrent/thread_safe_queue.hpp"
#include "tranche/eventbus/event_bus.hpp"
#include "tranche/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <thread>

namespace tranche {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: One worker thread draining a ThreadSafeQueue<Event> and
// publishing each event on its own EventBus.
//
// Role in architecture: LevelEngine subscribes its handlers (bar, fill,
// order status) to this loop's bus. Whatever thread the host calls back on,
// the handlers run one at a time on the loop thread, which is what keeps
// "exits before entries" and "one live order at a time" deterministic.
//
// Thread model: start(), stop() and push() are safe from any thread. All
// subscriber callbacks on eventBus() run on the loop thread once start() has
// been called.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Stops and joins the worker.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker. A second call while running is a no-op.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker to exit and joins it.
  //
  // @details
  // Events still queued when stop() is called are left in the queue; a later
  // start() processes them. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues an event for the loop thread.
  void push(Event event) { queue_.push(std::move(event)); }

  bool isRunning() const { return running_.load(); }

  std::size_t backlog() const { return queue_.size(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Worker entry point: pop_for() and publish until running_ clears. The
  // pop timeout bounds how long stop() waits for the join.
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace tranche
