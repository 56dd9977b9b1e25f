#include "rsvp/network/ipc_server.hpp"

#include "rsvp/domain/json_codec.hpp"
#include "rsvp/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace rsvp {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
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

// -----------------------------------------------------------------------------
// pushTelemetry(): thread-safe enqueue from any publisher thread
// -----------------------------------------------------------------------------
void IpcServer::pushTelemetry(LedgerEvent event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain: publish any remaining telemetry before shutdown.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    const std::string json_str = formatTelemetry(*maybe_event);
    zmq::message_t msg(json_str.data(), json_str.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
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
    // A REP socket must answer every request, and the handler must not take
    // the IPC thread down with it.
    std::cerr << "[IpcServer] CRITICAL: command handler threw: " << e.what()
              << "\n";
    response = handlerFailureReply();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// handlerFailureReply(): error envelope sent when the handler throws
// -----------------------------------------------------------------------------
std::string IpcServer::handlerFailureReply() {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["code"] = "Infrastructure";
  reply["message"] = "command handler failed";
  reply["retriable"] = true;
  return reply.dump();
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch LedgerEvent variant
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const LedgerEvent& event) {
  nlohmann::json j;

  if (auto* e = std::get_if<ReservationConfirmedEvent>(&event)) {
    j["type"] = "reservation_confirmed";
    j["reservation"] = e->reservation;
    j["available_spots"] = e->available_spots;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<ReservationCancelledEvent>(&event)) {
    j["type"] = "reservation_cancelled";
    j["reservation"] = e->reservation;
    j["available_spots"] = e->available_spots;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<JoinRejectedEvent>(&event)) {
    j["type"] = "join_rejected";
    j["event_id"] = e->event_id;
    j["user_id"] = e->user_id;
    j["code"] = domain::errorCodeToString(e->code);
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<ReconciliationRequiredEvent>(&event)) {
    j["type"] = "reconciliation_required";
    j["event_id"] = e->event_id;
    j["user_id"] = e->user_id;
    j["reason"] = e->reason;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<ReconciliationResolvedEvent>(&event)) {
    j["type"] = "reconciliation_resolved";
    j["event_id"] = e->event_id;
    j["user_id"] = e->user_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<EventUpdatedEvent>(&event)) {
    j["type"] = "event_updated";
    j["change"] = changeToString(e->change);
    j["event"] = e->event;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  }

  return j.dump();
}

}  // namespace rsvp
