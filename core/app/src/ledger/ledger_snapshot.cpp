#include "rsvp/ledger/ledger_snapshot.hpp"

#include "rsvp/domain/json_codec.hpp"
#include "rsvp/ledger/store_error.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <set>
#include <utility>
#include <stdexcept>
#include <vector>

namespace rsvp {

using json = nlohmann::json;

// -----------------------------------------------------------------------------
// save: serialize, write to <path>.tmp, rename over <path>
// -----------------------------------------------------------------------------
void LedgerSnapshot::save(const std::string& path, const IEventLedger& events,
                          const IReservationLedger& reservations,
                          std::int64_t saved_at_ms) {
  json doc;
  doc["version"] = kFormatVersion;
  doc["saved_at_ms"] = saved_at_ms;
  doc["events"] = events.listAll();
  doc["reservations"] = reservations.listAll();

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw StoreError("cannot open snapshot file for writing: " + tmp_path);
    }
    out << doc.dump(2);
    out.flush();
    if (!out) {
      throw StoreError("failed writing snapshot file: " + tmp_path);
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::remove(tmp_path.c_str());
    throw StoreError("cannot move snapshot into place: " + path);
  }

  std::cout << "[LedgerSnapshot] Saved " << doc["events"].size()
            << " events, " << doc["reservations"].size()
            << " reservations to " << path << "\n";
}

// -----------------------------------------------------------------------------
// load: parse fully before touching the ledgers
// -----------------------------------------------------------------------------
LedgerSnapshot::LoadSummary LedgerSnapshot::load(
    const std::string& path, IEventLedger& events,
    IReservationLedger& reservations, IdGenerator& event_ids,
    IdGenerator& reservation_ids) {
  std::ifstream in(path);
  if (!in) {
    throw StoreError("cannot open snapshot file: " + path);
  }

  std::vector<domain::Event> loaded_events;
  std::vector<domain::Reservation> loaded_reservations;
  LoadSummary summary;

  try {
    const json doc = json::parse(in);
    const int version = doc.at("version").get<int>();
    if (version != kFormatVersion) {
      throw StoreError("unsupported snapshot version " +
                       std::to_string(version) + " in " + path);
    }
    summary.saved_at_ms = doc.value("saved_at_ms", std::int64_t{0});
    loaded_events = doc.at("events").get<std::vector<domain::Event>>();
    loaded_reservations =
        doc.at("reservations").get<std::vector<domain::Reservation>>();
  } catch (const json::exception& e) {
    throw StoreError("malformed snapshot " + path + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw StoreError("malformed snapshot " + path + ": " + e.what());
  }

  // Shape checks the ledgers would also reject, done up front so a bad file
  // never leaves one ledger replaced and the other not.
  std::set<domain::EventId> event_keys;
  for (const auto& event : loaded_events) {
    if (!event_keys.insert(event.id).second) {
      throw StoreError("duplicate event id " + std::to_string(event.id) +
                       " in " + path);
    }
  }
  std::set<std::pair<domain::EventId, domain::UserId>> confirmed_keys;
  for (const auto& reservation : loaded_reservations) {
    if (reservation.status == domain::ReservationStatus::Confirmed &&
        !confirmed_keys.emplace(reservation.event_id, reservation.user_id)
             .second) {
      throw StoreError("duplicate confirmed reservation for event " +
                       std::to_string(reservation.event_id) + " user " +
                       reservation.user_id + " in " + path);
    }
  }

  events.restore(loaded_events);
  reservations.restore(loaded_reservations);

  for (const auto& event : loaded_events) {
    event_ids.advance_past(event.id);
  }
  for (const auto& reservation : loaded_reservations) {
    reservation_ids.advance_past(reservation.id);
  }

  summary.events = loaded_events.size();
  summary.reservations = loaded_reservations.size();

  std::cout << "[LedgerSnapshot] Loaded " << summary.events << " events, "
            << summary.reservations << " reservations from " << path << "\n";
  return summary;
}

}  // namespace rsvp
