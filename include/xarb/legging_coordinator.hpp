#pragma once
#include "xarb/alerts.hpp"
#include "xarb/common.hpp"
#include "xarb/venue.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

using AttemptObserver = std::function<void(const ExecutionAttempt &)>;

// Runs two-leg attempts as a state machine:
//
//   PLANNED → LEG1_SUBMITTED → LEG1_{FILLED,PARTIAL_FILL,REJECTED,TIMED_OUT}
//   Leg1 fill > 0 → LEG2_SUBMITTED (sized to the fill)
//                 → BOTH_FILLED | LEG2_PARTIAL_FILL
//                 | LEG2_{REJECTED,TIMED_OUT} → NAKED_EXPOSURE
//   Leg1 no fill  → ABANDONED
//
// One attempt per pair key at a time; different pairs run concurrently.
class LeggingCoordinator {
public:
  LeggingCoordinator(const Config &config, VenueRegistry &venues,
                     AlertSink *alerts = nullptr);
  ~LeggingCoordinator();

  LeggingCoordinator(const LeggingCoordinator &) = delete;
  LeggingCoordinator &operator=(const LeggingCoordinator &) = delete;

  // Observers see every terminal attempt, in registration order.
  void addObserver(AttemptObserver observer);

  // Start an attempt in the background. Refused (nullopt) if the
  // opportunity is stale, alert-only, or its pair already has an attempt
  // in flight.
  std::optional<std::shared_future<ExecutionAttempt>>
  submit(const Opportunity &opp, Timestamp now);

  // Run an attempt on the calling thread. Same state machine as submit(),
  // no staleness or exclusivity check.
  ExecutionAttempt execute(const Opportunity &opp);

  // Abort an attempt whose Leg1 has no fill yet. False once any Leg1 fill
  // has been seen, or if nothing is in flight for the pair.
  bool cancel(const std::string &pair_key);

  bool inFlight(const std::string &pair_key) const;
  std::vector<ExecutionAttempt> openAttempts() const;
  size_t inFlightCount() const;

  // Block until every submitted attempt has finished.
  void waitIdle();

private:
  struct Flight {
    ExecutionAttempt attempt; // latest published copy
    bool cancel_requested = false;
    bool leg1_has_fill = false;
    std::shared_future<ExecutionAttempt> future;
  };

  ExecutionAttempt run(ExecutionAttempt attempt);
  void executeLeg(ExecutionAttempt &attempt, LegRecord &leg, int timeout_ms,
                  bool cancellable);
  // Place once. A transient failure may hide an accepted order, so every
  // retry first looks the leg up by its client order id.
  OrderHandle placeLeg(const LegRecord &leg);
  OrderHandle sendLeg(const LegRecord &leg);
  std::optional<OrderHandle> findLeg(const LegRecord &leg);
  OrderStatus pollLeg(const LegRecord &leg, const OrderHandle &handle);
  void cancelLeg(const LegRecord &leg, const OrderHandle &handle);

  void transition(ExecutionAttempt &attempt, AttemptState next);
  void publish(const ExecutionAttempt &attempt);
  bool cancelRequested(const std::string &pair_key) const;
  void finish(ExecutionAttempt &attempt);
  void settleOutcome(ExecutionAttempt &attempt);
  void reap();

  Config config_;
  VenueRegistry &venues_;
  AlertSink *alerts_;
  std::vector<AttemptObserver> observers_;
  std::map<std::string, Flight> flights_;
  // Futures of finished workers. Released from a caller thread, never from
  // the worker itself: the last std::async future joins its thread.
  std::vector<std::shared_future<ExecutionAttempt>> finished_;
  std::atomic<long> next_id_{1};
  std::string session_; // keeps client order ids unique across restarts
  mutable std::mutex mtx_;
};

} // namespace xarb
