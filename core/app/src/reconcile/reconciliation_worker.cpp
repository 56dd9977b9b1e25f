#include "rsvp/reconcile/reconciliation_worker.hpp"

#include <iostream>

namespace rsvp {

ReconciliationWorker::ReconciliationWorker(ReservationService& service,
                                           std::chrono::milliseconds interval)
    : service_(service), interval_(interval) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ReconciliationWorker::~ReconciliationWorker() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the retry thread
// -----------------------------------------------------------------------------
void ReconciliationWorker::start() {
  if (running_.load()) {
    return;
  }
  running_.store(true);
  passes_.store(0);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ReconciliationWorker] started. Interval="
            << interval_.count() << "ms\n";
}

// -----------------------------------------------------------------------------
// stop(): clear the flag under the wake mutex, notify, join
// -----------------------------------------------------------------------------
void ReconciliationWorker::stop() {
  {
    std::lock_guard lock(wake_mutex_);
    if (!running_.load()) {
      if (thread_.joinable()) {
        thread_.join();
      }
      return;
    }
    running_.store(false);
  }
  wake_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }

  std::cout << "[ReconciliationWorker] stopped.\n";
}

// -----------------------------------------------------------------------------
// run(): sleep, retry, repeat
// -----------------------------------------------------------------------------
void ReconciliationWorker::run() {
  for (;;) {
    {
      std::unique_lock lock(wake_mutex_);
      wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
      if (!running_.load()) {
        return;
      }
    }

    const auto summary = service_.retryPendingReleases();
    if (summary.attempted > 0) {
      std::cout << "[ReconciliationWorker] Retried " << summary.attempted
                << " pending release(s), " << summary.resolved
                << " resolved.\n";
    }
    passes_.fetch_add(1);
  }
}

}  // namespace rsvp
