#include "tranche/network/ipc_server.hpp"

#include "tranche/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace tranche {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then hand them to the worker
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

  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] Listening for commands on " << cmd_endpoint_
            << ", telemetry on " << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] Shut down after " << commands_.load()
            << " command(s), " << published_.load()
            << " telemetry message(s)\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): poll for a command, then flush telemetry
// -----------------------------------------------------------------------------
void IpcServer::run() {
  std::vector<zmq::pollitem_t> items = {
      {cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};

  while (running_.load()) {
    int ready = 0;
    try {
      ready = zmq::poll(items, std::chrono::milliseconds(kPollTimeoutMs));
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[IpcServer] ERROR: poll failed: " << e.what()
                << ". Worker exiting.\n";
      running_.store(false);
      break;
    }

    if (ready > 0 && (items[0].revents & ZMQ_POLLIN) != 0) {
      answerCommand();
    }
    publishPending();
  }

  // Events queued before stop() still go out.
  publishPending();
}

// -----------------------------------------------------------------------------
// publishPending(): topic frame, then the JSON body
// -----------------------------------------------------------------------------
void IpcServer::publishPending() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto body = toTelemetry(*event);
    if (!body) {
      continue;
    }

    const std::string topic = body->at("type").get<std::string>();
    const std::string payload = body->dump();

    if (!pub_socket_->send(zmq::buffer(topic),
                           zmq::send_flags::sndmore |
                               zmq::send_flags::dontwait)) {
      continue;
    }
    // Once the topic frame is queued the body must follow, or the next
    // topic would be appended to this message.
    if (pub_socket_->send(zmq::buffer(payload), zmq::send_flags::none)) {
      published_.fetch_add(1);
    }
  }
}

// -----------------------------------------------------------------------------
// answerCommand(): exactly one reply per request
// -----------------------------------------------------------------------------
void IpcServer::answerCommand() {
  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  const std::string reply = runHandler(request.to_string());
  if (!cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none)) {
    std::cerr << "[IpcServer] WARNING: reply to '" << request.to_string()
              << "' was not sent\n";
    return;
  }
  commands_.fetch_add(1);
}

std::string IpcServer::runHandler(const std::string& cmd) {
  try {
    return command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] WARNING: command '" << cmd
              << "' failed: " << e.what() << "\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = e.what();
    return error.dump(-1, ' ', false,
                      nlohmann::json::error_handler_t::replace);
  }
}

}  // namespace tranche
