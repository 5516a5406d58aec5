#include "tranche/network/host_gateway_thread.hpp"

#include <iostream>
#include <utility>

namespace tranche {

HostGatewayThread::HostGatewayThread(EventSink event_sink,
                                     std::string endpoint)
    : event_sink_(std::move(event_sink)), endpoint_(std::move(endpoint)) {}

HostGatewayThread::~HostGatewayThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void HostGatewayThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<HostGateway>(event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[HostGatewayThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[HostGatewayThread] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void HostGatewayThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  gateway_.reset();
}

}  // namespace tranche
