#include "rsvp/ledger/in_memory_reservation_ledger.hpp"

#include "rsvp/ledger/store_error.hpp"

#include <algorithm>
#include <mutex>
#include <string>

namespace rsvp {

using domain::EventId;
using domain::Reservation;
using domain::ReservationStatus;
using domain::UserId;

// -----------------------------------------------------------------------------
// Partition lookup helpers
// -----------------------------------------------------------------------------
std::shared_ptr<InMemoryReservationLedger::Partition>
InMemoryReservationLedger::lookup(EventId event_id) const {
  std::shared_lock lock(index_mutex_);
  auto it = index_.find(event_id);
  return (it != index_.end()) ? it->second : nullptr;
}

std::shared_ptr<InMemoryReservationLedger::Partition>
InMemoryReservationLedger::lookupOrCreate(EventId event_id) {
  if (auto existing = lookup(event_id)) {
    return existing;
  }
  std::unique_lock lock(index_mutex_);
  auto& slot = index_[event_id];
  if (!slot) {
    slot = std::make_shared<Partition>();
  }
  return slot;
}

std::vector<std::pair<EventId, std::shared_ptr<InMemoryReservationLedger::Partition>>>
InMemoryReservationLedger::allPartitions() const {
  std::vector<std::pair<EventId, std::shared_ptr<Partition>>> result;
  {
    std::shared_lock lock(index_mutex_);
    result.reserve(index_.size());
    for (const auto& [event_id, partition] : index_) {
      result.emplace_back(event_id, partition);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  return result;
}

// -----------------------------------------------------------------------------
// insertConfirmed: uniqueness check and insert in one critical section
// -----------------------------------------------------------------------------
InsertOutcome InMemoryReservationLedger::insertConfirmed(
    const Reservation& reservation) {
  if (reservation.status != ReservationStatus::Confirmed) {
    throw StoreError("insertConfirmed called with a non-confirmed record");
  }

  // Loop only when the partition was detached between lookup and lock.
  for (;;) {
    auto partition = lookupOrCreate(reservation.event_id);
    std::unique_lock lock(partition->mutex);
    if (partition->detached) {
      continue;
    }
    if (!partition->confirmed_users.insert(reservation.user_id).second) {
      return InsertOutcome::DuplicateConfirmed;
    }
    partition->records.push_back(reservation);
    return InsertOutcome::Inserted;
  }
}

// -----------------------------------------------------------------------------
// cancelConfirmed: Confirmed → Cancelled, stamp cancelled_at_ms
// -----------------------------------------------------------------------------
std::optional<Reservation> InMemoryReservationLedger::cancelConfirmed(
    EventId event_id, const UserId& user_id, std::int64_t now_ms) {
  auto partition = lookup(event_id);
  if (!partition) {
    return std::nullopt;
  }

  std::unique_lock lock(partition->mutex);
  if (partition->detached || partition->confirmed_users.erase(user_id) == 0) {
    return std::nullopt;
  }

  for (auto& record : partition->records) {
    if (record.user_id == user_id &&
        record.status == ReservationStatus::Confirmed) {
      record.status = ReservationStatus::Cancelled;
      record.cancelled_at_ms = now_ms;
      return record;
    }
  }
  throw StoreError("confirmed index out of sync for event " +
                   std::to_string(event_id) + " user " + user_id);
}

// -----------------------------------------------------------------------------
// Reads: shared partition locks only
// -----------------------------------------------------------------------------
std::optional<Reservation> InMemoryReservationLedger::findConfirmed(
    EventId event_id, const UserId& user_id) const {
  auto partition = lookup(event_id);
  if (!partition) {
    return std::nullopt;
  }

  std::shared_lock lock(partition->mutex);
  if (partition->confirmed_users.count(user_id) == 0) {
    return std::nullopt;
  }
  for (const auto& record : partition->records) {
    if (record.user_id == user_id &&
        record.status == ReservationStatus::Confirmed) {
      return record;
    }
  }
  return std::nullopt;
}

std::vector<Reservation> InMemoryReservationLedger::listConfirmed(
    EventId event_id) const {
  std::vector<Reservation> result;
  auto partition = lookup(event_id);
  if (!partition) {
    return result;
  }

  {
    std::shared_lock lock(partition->mutex);
    for (const auto& record : partition->records) {
      if (record.status == ReservationStatus::Confirmed) {
        result.push_back(record);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Reservation& a, const Reservation& b) {
              if (a.created_at_ms != b.created_at_ms) {
                return a.created_at_ms < b.created_at_ms;
              }
              return a.id < b.id;
            });
  return result;
}

std::vector<Reservation> InMemoryReservationLedger::listByUser(
    const UserId& user_id, std::optional<ReservationStatus> status) const {
  std::vector<Reservation> result;
  for (const auto& [event_id, partition] : allPartitions()) {
    std::shared_lock lock(partition->mutex);
    for (const auto& record : partition->records) {
      if (record.user_id == user_id &&
          (!status || record.status == *status)) {
        result.push_back(record);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Reservation& a, const Reservation& b) {
              if (a.created_at_ms != b.created_at_ms) {
                return a.created_at_ms > b.created_at_ms;
              }
              return a.id > b.id;
            });
  return result;
}

std::size_t InMemoryReservationLedger::countConfirmed(EventId event_id) const {
  auto partition = lookup(event_id);
  if (!partition) {
    return 0;
  }
  std::shared_lock lock(partition->mutex);
  return partition->confirmed_users.size();
}

std::vector<Reservation> InMemoryReservationLedger::listAll() const {
  std::vector<Reservation> result;
  for (const auto& [event_id, partition] : allPartitions()) {
    std::shared_lock lock(partition->mutex);
    result.insert(result.end(), partition->records.begin(),
                  partition->records.end());
  }
  return result;
}

// -----------------------------------------------------------------------------
// Physical removal
// -----------------------------------------------------------------------------
bool InMemoryReservationLedger::remove(EventId event_id,
                                       domain::ReservationId id) {
  auto partition = lookup(event_id);
  if (!partition) {
    return false;
  }

  std::unique_lock lock(partition->mutex);
  auto& records = partition->records;
  auto it = std::find_if(records.begin(), records.end(),
                         [id](const Reservation& r) { return r.id == id; });
  if (it == records.end()) {
    return false;
  }
  if (it->status == ReservationStatus::Confirmed) {
    partition->confirmed_users.erase(it->user_id);
  }
  records.erase(it);
  return true;
}

std::vector<Reservation> InMemoryReservationLedger::removeByEvent(
    EventId event_id) {
  std::shared_ptr<Partition> partition;
  {
    std::unique_lock lock(index_mutex_);
    auto it = index_.find(event_id);
    if (it == index_.end()) {
      return {};
    }
    partition = std::move(it->second);
    index_.erase(it);
  }

  std::unique_lock lock(partition->mutex);
  partition->detached = true;
  partition->confirmed_users.clear();
  return std::move(partition->records);
}

std::vector<Reservation> InMemoryReservationLedger::removeByUser(
    const UserId& user_id) {
  std::vector<Reservation> removed;
  for (const auto& [event_id, partition] : allPartitions()) {
    std::unique_lock lock(partition->mutex);
    auto& records = partition->records;
    auto split = std::stable_partition(
        records.begin(), records.end(),
        [&user_id](const Reservation& r) { return r.user_id != user_id; });
    if (split == records.end()) {
      continue;
    }
    removed.insert(removed.end(), std::make_move_iterator(split),
                   std::make_move_iterator(records.end()));
    records.erase(split, records.end());
    partition->confirmed_users.erase(user_id);
  }
  return removed;
}

// -----------------------------------------------------------------------------
// restore: replace everything (snapshot load)
// -----------------------------------------------------------------------------
void InMemoryReservationLedger::restore(
    const std::vector<Reservation>& records) {
  std::unordered_map<EventId, std::shared_ptr<Partition>> fresh;
  for (const auto& record : records) {
    auto& partition = fresh[record.event_id];
    if (!partition) {
      partition = std::make_shared<Partition>();
    }
    if (record.status == ReservationStatus::Confirmed &&
        !partition->confirmed_users.insert(record.user_id).second) {
      throw StoreError("two confirmed reservations for event " +
                       std::to_string(record.event_id) + " user " +
                       record.user_id + " in restore set");
    }
    partition->records.push_back(record);
  }

  std::unique_lock lock(index_mutex_);
  for (auto& [event_id, old_partition] : index_) {
    std::unique_lock partition_lock(old_partition->mutex);
    old_partition->detached = true;
  }
  index_ = std::move(fresh);
}

}  // namespace rsvp
