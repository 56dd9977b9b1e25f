#include "rsvp/engine/reservation_engine.hpp"

#include "rsvp/domain/json_codec.hpp"
#include "rsvp/ledger/ledger_snapshot.hpp"
#include "rsvp/ledger/store_error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace rsvp {

using json = nlohmann::json;

namespace {

// Thrown for arguments that are well-formed JSON but do not fit the field
// they are read into.
class BadArgument : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Parse errors echo the offending input bytes, which need not be valid
// UTF-8; replace them instead of throwing type_error.316.
std::string dumpResponse(const json& response) {
  return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

domain::EventId readEventId(const json& cmd, const char* key) {
  const json& value = cmd.at(key);
  if (!value.is_number_unsigned()) {
    throw BadArgument(std::string(key) + " must be a non-negative integer");
  }
  return value.get<domain::EventId>();
}

std::int64_t readInt64(const json& cmd, const char* key) {
  const json& value = cmd.at(key);
  if (value.is_number_unsigned()) {
    const auto raw = value.get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(
                  std::numeric_limits<std::int64_t>::max())) {
      throw BadArgument(std::string(key) + " is out of range");
    }
    return static_cast<std::int64_t>(raw);
  }
  if (!value.is_number_integer()) {
    throw BadArgument(std::string(key) + " must be an integer");
  }
  return value.get<std::int64_t>();
}

std::int32_t readInt32(const json& cmd, const char* key) {
  const std::int64_t wide = readInt64(cmd, key);
  if (wide < std::numeric_limits<std::int32_t>::min() ||
      wide > std::numeric_limits<std::int32_t>::max()) {
    throw BadArgument(std::string(key) + " is out of range");
  }
  return static_cast<std::int32_t>(wide);
}

json errorResponse(const domain::Error& error) {
  json response;
  response["status"] = "error";
  response["code"] = domain::errorCodeToString(error.code);
  response["message"] = error.message;
  response["retriable"] = domain::isRetriable(error.code);
  return response;
}

std::string errorReply(const domain::Error& error) {
  return dumpResponse(errorResponse(error));
}

json okResponse() {
  json response;
  response["status"] = "ok";
  return response;
}

json viewToJson(const ReservationService::EventView& view) {
  json j = view.event;
  j["available_spots"] = view.available_spots;
  j["is_full"] = view.is_full;
  j["is_past"] = view.is_past;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ReservationEngine::ReservationEngine(const ITimeProvider& clock,
                                     EngineConfig config)
    : clock_(clock),
      config_(std::move(config)),
      event_ledger_(config_.limits.duration_hint_ms),
      default_reconciler_(event_ledger_, reservation_ledger_, clock_) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ReservationEngine::~ReservationEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ReservationEngine::start(IReconciler* reconciler) {
  if (running_) {
    return;
  }

  // ---  1) Restore ledgers ----------------------------------------------------
  loadSnapshot();

  // ---  2) Synchronization gate -----------------------------------------------
  IReconciler& gate = (reconciler != nullptr) ? *reconciler : default_reconciler_;
  last_reconciliation_ = gate.reconcileAll();

  // ---  3) Service --------------------------------------------------------------
  service_ = std::make_unique<ReservationService>(
      event_ledger_, reservation_ledger_, clock_, event_ids_, reservation_ids_,
      bus_, config_.limits);

  // ---  4) Pending-release worker ---------------------------------------------
  worker_ = std::make_unique<ReconciliationWorker>(
      *service_, std::chrono::milliseconds(config_.reconcile_interval_ms));
  worker_->start();

  // ---  5) Command gate -----------------------------------------------------
  {
    std::unique_lock lock(command_mutex_);
    accepting_commands_ = true;
  }

  // ---  6) IPC server (commands + telemetry) ----------------------------------
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    try {
      ipc_server_->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[ReservationEngine] CRITICAL: IPC bind failed: "
                << e.what() << "\n";
      {
        std::unique_lock lock(command_mutex_);
        accepting_commands_ = false;
      }
      ipc_server_.reset();
      worker_.reset();
      service_.reset();
      throw;
    }

    IpcServer* server = ipc_server_.get();
    telemetry_sub_ = bus_.subscribe(
        [server](const LedgerEvent& e) { server->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[ReservationEngine] started. Threads: reconcile"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ReservationEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Close the command gate (waits for in-flight commands) -------------
  {
    std::unique_lock lock(command_mutex_);
    accepting_commands_ = false;
  }

  // ---  2) Stop worker ---------------------------------------------------------
  // Joined before the telemetry subscriber goes away: a retry pass publishes
  // from a copy of the subscriber list.
  worker_.reset();

  // ---  3) Stop IPC (joins its thread) -----------------------------------------
  if (telemetry_sub_) {
    bus_.unsubscribe(*telemetry_sub_);
    telemetry_sub_.reset();
  }
  ipc_server_.reset();

  // ---  4) Persist --------------------------------------------------------------
  saveSnapshot();

  // ---  5) Service --------------------------------------------------------------
  if (service_ && service_->pendingCount() > 0) {
    std::cerr << "[ReservationEngine] WARNING: stopping with "
              << service_->pendingCount()
              << " pending release(s); the next startup gate repairs them.\n";
  }
  service_.reset();

  running_ = false;

  std::cout << "[ReservationEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Snapshot helpers
// -----------------------------------------------------------------------------
void ReservationEngine::loadSnapshot() {
  if (config_.snapshot_path.empty()) {
    return;
  }
  if (!std::filesystem::exists(config_.snapshot_path)) {
    std::cout << "[ReservationEngine] No snapshot at "
              << config_.snapshot_path << ", starting empty.\n";
    return;
  }
  try {
    LedgerSnapshot::load(config_.snapshot_path, event_ledger_,
                         reservation_ledger_, event_ids_, reservation_ids_);
  } catch (const StoreError& e) {
    std::cerr << "[ReservationEngine] CRITICAL: snapshot load failed: "
              << e.what() << "\n";
    throw;
  }
}

void ReservationEngine::saveSnapshot() {
  if (config_.snapshot_path.empty()) {
    return;
  }
  try {
    LedgerSnapshot::save(config_.snapshot_path, event_ledger_,
                         reservation_ledger_, clock_.now_ms());
  } catch (const StoreError& e) {
    std::cerr << "[ReservationEngine] CRITICAL: snapshot save failed: "
              << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON operation surface
// -----------------------------------------------------------------------------
std::string ReservationEngine::executeCommand(const std::string& request) {
  using domain::ErrorCode;

  std::shared_lock lock(command_mutex_);
  ReservationService* service = service_.get();
  if (!accepting_commands_ || service == nullptr) {
    return errorReply({ErrorCode::Infrastructure, "engine is not running"});
  }

  json response;
  try {
    const json cmd = json::parse(request);
    const std::string op = cmd.at("op").get<std::string>();

    if (op == "ping") {
      response = okResponse();
      response["response"] = "pong";

    } else if (op == "join") {
      auto result = service->join(readEventId(cmd, "event_id"),
                                  cmd.at("user_id").get<std::string>(),
                                  cmd.value("notes", std::string{}));
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["reservation"] = result.value().reservation;
      response["available_spots"] = result.value().available_spots;

    } else if (op == "leave") {
      auto result = service->leave(readEventId(cmd, "event_id"),
                                   cmd.at("user_id").get<std::string>());
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["available_spots"] = result.value();

    } else if (op == "status") {
      response = okResponse();
      response["reserved"] =
          service->status(readEventId(cmd, "event_id"),
                          cmd.at("user_id").get<std::string>());

    } else if (op == "attendees") {
      response = okResponse();
      response["attendees"] =
          service->listAttendees(readEventId(cmd, "event_id"));

    } else if (op == "my_reservations") {
      const std::string filter = cmd.value("filter", std::string{"confirmed"});
      std::optional<domain::ReservationStatus> status;
      if (filter != "all") {
        status = domain::reservationStatusFromString(filter);
        if (!status) {
          return errorReply({ErrorCode::InvalidArgument,
                             "unknown reservation filter: " + filter});
        }
      }
      response = okResponse();
      response["reservations"] = service->listUserReservations(
          cmd.at("user_id").get<std::string>(), status);

    } else if (op == "event") {
      auto result = service->getEvent(readEventId(cmd, "event_id"));
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["event"] = viewToJson(result.value());

    } else if (op == "my_events") {
      json events = json::array();
      for (const auto& view :
           service->listOrganizerEvents(cmd.at("user_id").get<std::string>())) {
        events.push_back(viewToJson(view));
      }
      response = okResponse();
      response["events"] = std::move(events);

    } else if (op == "create_event") {
      domain::EventDraft draft;
      draft.title = cmd.at("title").get<std::string>();
      draft.description = cmd.value("description", std::string{});
      draft.location = cmd.at("location").get<std::string>();
      draft.scheduled_at_ms = readInt64(cmd, "scheduled_at_ms");
      draft.capacity = readInt32(cmd, "capacity");
      const std::string category = cmd.value("category", std::string{"other"});
      const auto parsed = domain::eventCategoryFromString(category);
      if (!parsed) {
        return errorReply({ErrorCode::InvalidArgument,
                           "unknown category: " + category});
      }
      draft.category = *parsed;

      auto result =
          service->createEvent(cmd.at("user_id").get<std::string>(), draft);
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["event"] = result.value();

    } else if (op == "update_capacity") {
      auto result = service->updateCapacity(
          readEventId(cmd, "event_id"),
          cmd.at("user_id").get<std::string>(),
          readInt32(cmd, "capacity"));
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["event"] = result.value();

    } else if (op == "reschedule") {
      auto result = service->reschedule(
          readEventId(cmd, "event_id"),
          cmd.at("user_id").get<std::string>(),
          readInt64(cmd, "scheduled_at_ms"));
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["event"] = result.value();

    } else if (op == "cancel_event") {
      auto result =
          service->cancelEvent(readEventId(cmd, "event_id"),
                               cmd.at("user_id").get<std::string>());
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["event"] = result.value();

    } else if (op == "delete_event") {
      auto result =
          service->deleteEvent(readEventId(cmd, "event_id"),
                               cmd.at("user_id").get<std::string>());
      if (!result) {
        return errorReply(result.error());
      }
      response = okResponse();
      response["removed_reservations"] = result.value();

    } else if (op == "delete_user") {
      const auto summary =
          service->deleteUser(cmd.at("user_id").get<std::string>());
      response = okResponse();
      response["events_deleted"] = summary.events_deleted;
      response["reservations_removed"] = summary.reservations_removed;
      response["slots_released"] = summary.slots_released;

    } else if (op == "reconcile") {
      const auto summary = service->retryPendingReleases();
      response = okResponse();
      response["attempted"] = summary.attempted;
      response["resolved"] = summary.resolved;
      response["pending"] = service->pendingCount();

    } else if (op == "stats") {
      response = okResponse();
      response["events"] = event_ledger_.size();
      response["reservations"] = reservation_ledger_.listAll().size();
      response["pending_releases"] = service->pendingCount();
      response["bus_subscribers"] = bus_.subscriberCount();
      if (last_reconciliation_) {
        response["startup_reconciliation"] = {
            {"events_checked", last_reconciliation_->events_checked},
            {"events_repaired", last_reconciliation_->events_repaired},
            {"orphans_removed", last_reconciliation_->orphans_removed},
            {"overflow_cancelled", last_reconciliation_->overflow_cancelled},
        };
      }

    } else {
      return errorReply({ErrorCode::InvalidArgument, "unknown op: " + op});
    }
  } catch (const json::exception& e) {
    return errorReply({ErrorCode::InvalidArgument,
                       std::string("malformed request: ") + e.what()});
  } catch (const BadArgument& e) {
    return errorReply({ErrorCode::InvalidArgument,
                       std::string("invalid argument: ") + e.what()});
  }

  return dumpResponse(response);
}

}  // namespace rsvp
