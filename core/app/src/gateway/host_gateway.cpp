#include "tranche/gateway/host_gateway.hpp"

#include "tranche/codec/json_codec.hpp"

#include <iostream>
#include <utility>

namespace tranche {

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
HostGateway::HostGateway(EventSink event_sink, const std::string& endpoint)
    : event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() blocks forever and stop() is never
  // observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void HostGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // Timeout; re-check the stop flag
    }

    received_.fetch_add(1);
    auto event = decodeHostMessage(msg.to_string());
    if (!event) {
      dropped_.fetch_add(1);
      continue;
    }
    event_sink_(std::move(*event));
  }

  std::cout << "[HostGateway] received " << received_.load()
            << " message(s), dropped " << dropped_.load() << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void HostGateway::stop() { running_.store(false); }

}  // namespace tranche
