#pragma once

#include "rsvp/concurrent/thread_safe_queue.hpp"
#include "rsvp/events/ledger_event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace rsvp {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers JSON commands on a REP socket and
//         broadcasts ledger events as JSON on a PUB socket.
//
// @details
// Two sockets, one thread:
//
//   1. REP socket (commands):
//      Each request is a JSON object such as
//        {"op":"join","event_id":7,"user_id":"u-42"}
//      and is handed to the command handler (bound to
//      ReservationEngine::executeCommand()). The reply is the handler's JSON
//      string; a handler that throws is answered with an Infrastructure
//      error envelope instead. ZMQ_RCVTIMEO bounds every recv so the loop keeps draining
//      telemetry and notices stop() within kPollTimeoutMs.
//
//   2. PUB socket (telemetry):
//      Ledger events arrive through pushTelemetry() from whichever thread
//      published them on the EventBus, wait in a ThreadSafeQueue, and are
//      serialized and sent on the IPC thread. A service thread never touches
//      a socket.
//
// The REP pattern is strictly request/reply, so commands are handled one at
// a time. Concurrency inside the engine comes from in-process callers; the
// IPC surface is for operators and tools.
//
// Thread model:
//   start() / stop() from the owning thread. pushTelemetry() from any
//   thread. The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by ReservationEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue, and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler  JSON request in, JSON response out.
  // @param  cmd_endpoint     ZMQ endpoint the REP socket binds.
  // @param  pub_endpoint     ZMQ endpoint the PUB socket binds.
  //
  // No sockets are opened and no threads are spawned here.
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds REP and PUB, sets ZMQ_RCVTIMEO and spawns the
  // worker thread. Idempotent. Throws zmq::error_t if a bind fails.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears running_, joins the worker (after a final telemetry drain) and
  // closes the sockets. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // @brief  Enqueues a ledger event for the PUB socket. Any thread.
  void pushTelemetry(LedgerEvent event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  One JSON object per ledger event, tagged with "type":
  //           reservation_confirmed, reservation_cancelled, join_rejected,
  //           reconciliation_required, reconciliation_resolved,
  //           event_updated.
  //
  // Pure function; public so the wire shape can be tested without sockets.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const LedgerEvent& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();
  static std::string handlerFailureReply();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<LedgerEvent> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace rsvp
