#pragma once

#include "rsvp/reservation/reservation_service.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace rsvp {

// -----------------------------------------------------------------------------
// ReconciliationWorker: background retry of pending slot releases
// -----------------------------------------------------------------------------
//
// @brief  Dedicated thread that calls
//         ReservationService::retryPendingReleases() every `interval`.
//
// @details
// A Leave whose slot release failed returns ReconciliationRequired and
// leaves the pair pending in the service. This worker drives those pairs
// to completion without any caller having to retry.
//
// The sleep between passes is a condition_variable wait_for, so stop()
// wakes the thread immediately instead of waiting out the interval.
//
// Thread model:
//   start() / stop() from the owning thread (ReservationEngine on main).
//   The worker thread only calls into ReservationService, which is
//   thread-safe.
//
// Ownership:
//   Owned by ReservationEngine via std::unique_ptr. Holds a reference to the
//   service, which must outlive the worker.
// -----------------------------------------------------------------------------
class ReconciliationWorker {
 public:
  ReconciliationWorker(ReservationService& service,
                       std::chrono::milliseconds interval);

  ~ReconciliationWorker();

  ReconciliationWorker(const ReconciliationWorker&) = delete;
  ReconciliationWorker& operator=(const ReconciliationWorker&) = delete;
  ReconciliationWorker(ReconciliationWorker&&) = delete;
  ReconciliationWorker& operator=(ReconciliationWorker&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Blocks until the thread has exited.
  void stop();

  bool isRunning() const { return running_.load(); }

  // Number of completed passes since start().
  std::uint64_t passes() const { return passes_.load(); }

 private:
  void run();

  ReservationService& service_;
  const std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> passes_{0};

  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::thread thread_;
};

}  // namespace rsvp
