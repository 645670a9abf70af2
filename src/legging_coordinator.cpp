#include "xarb/legging_coordinator.hpp"
#include "xarb/errors.hpp"
#include "xarb/odds.hpp"
#include "xarb/retry.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace xarb {

static constexpr double kUnitEps = 1e-9;

LeggingCoordinator::LeggingCoordinator(const Config &config,
                                       VenueRegistry &venues, AlertSink *alerts)
    : config_(config), venues_(venues), alerts_(alerts),
      session_(std::to_string(
          std::chrono::duration_cast<std::chrono::seconds>(
              Clock::now().time_since_epoch())
              .count())) {}

LeggingCoordinator::~LeggingCoordinator() { waitIdle(); }

void LeggingCoordinator::addObserver(AttemptObserver observer) {
  std::lock_guard<std::mutex> lock(mtx_);
  observers_.push_back(std::move(observer));
}

static ExecutionAttempt makeAttempt(const Opportunity &opp, long seq) {
  ExecutionAttempt a;
  a.id = fmt::format("{}#{}", opp.pair_key, seq);
  a.opportunity = opp;
  a.state = AttemptState::PLANNED;
  a.history.push_back(AttemptState::PLANNED);
  a.leg1.plan = opp.legs.at(0);
  a.leg2.plan = opp.legs.at(1);
  a.planned_edge = opp.edge;
  a.started_at = Clock::now();
  return a;
}

// ── Submission ───────────────────────────────────────────────────────
std::optional<std::shared_future<ExecutionAttempt>>
LeggingCoordinator::submit(const Opportunity &opp, Timestamp now) {
  if (!opp.executable) {
    spdlog::debug("[Legging] {} is alert-only, not dispatched", opp.pair_key);
    return std::nullopt;
  }
  double age = ageMs(opp.detected_at, now);
  if (age > config_.stale_ms) {
    spdlog::warn("[Legging] {} refused: stale ({:.0f}ms)", opp.pair_key, age);
    return std::nullopt;
  }
  if (opp.legs.size() != 2) {
    spdlog::error("[Legging] {} refused: plan has {} legs", opp.pair_key,
                  opp.legs.size());
    return std::nullopt;
  }

  reap();
  std::lock_guard<std::mutex> lock(mtx_);
  if (flights_.count(opp.pair_key)) {
    spdlog::debug("[Legging] {} refused: attempt already in flight",
                  opp.pair_key);
    return std::nullopt;
  }

  ExecutionAttempt attempt = makeAttempt(opp, next_id_++);
  auto &flight = flights_[opp.pair_key];
  flight.attempt = attempt;
  // The worker takes mtx_ first thing, so it waits for this scope to end
  flight.future =
      std::async(std::launch::async, [this, attempt]() { return run(attempt); })
          .share();
  return flight.future;
}

ExecutionAttempt LeggingCoordinator::execute(const Opportunity &opp) {
  if (opp.legs.size() != 2)
    throw std::invalid_argument("Execution plan needs exactly two legs");
  return run(makeAttempt(opp, next_id_++));
}

bool LeggingCoordinator::cancel(const std::string &pair_key) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = flights_.find(pair_key);
  if (it == flights_.end())
    return false;
  if (it->second.leg1_has_fill) {
    spdlog::warn("[Legging] {} cancel refused: Leg1 already filled", pair_key);
    return false;
  }
  it->second.cancel_requested = true;
  spdlog::info("[Legging] {} cancel requested", pair_key);
  return true;
}

bool LeggingCoordinator::inFlight(const std::string &pair_key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return flights_.count(pair_key) > 0;
}

size_t LeggingCoordinator::inFlightCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return flights_.size();
}

std::vector<ExecutionAttempt> LeggingCoordinator::openAttempts() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<ExecutionAttempt> out;
  for (const auto &[key, f] : flights_)
    out.push_back(f.attempt);
  return out;
}

void LeggingCoordinator::waitIdle() {
  while (true) {
    std::vector<std::shared_future<ExecutionAttempt>> pending;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      for (const auto &[key, f] : flights_)
        if (f.future.valid())
          pending.push_back(f.future);
    }
    if (pending.empty()) {
      reap();
      return;
    }
    for (auto &f : pending)
      f.wait();
    // the worker erases its entry before returning, so loop until empty
  }
}

// ── Bookkeeping ──────────────────────────────────────────────────────
void LeggingCoordinator::transition(ExecutionAttempt &attempt,
                                    AttemptState next) {
  spdlog::debug("[Legging] {} {} → {}", attempt.id, toString(attempt.state),
                toString(next));
  attempt.state = next;
  attempt.history.push_back(next);
  publish(attempt);
}

void LeggingCoordinator::publish(const ExecutionAttempt &attempt) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = flights_.find(attempt.opportunity.pair_key);
  if (it == flights_.end() || it->second.attempt.id != attempt.id)
    return;
  it->second.attempt = attempt;
  if (attempt.leg1.filled_size > kUnitEps)
    it->second.leg1_has_fill = true;
}

bool LeggingCoordinator::cancelRequested(const std::string &pair_key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = flights_.find(pair_key);
  return it != flights_.end() && it->second.cancel_requested;
}

void LeggingCoordinator::finish(ExecutionAttempt &attempt) {
  attempt.finished_at = Clock::now();

  std::vector<AttemptObserver> observers;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    observers = observers_;
  }
  // Observers run while the pair is still marked in flight, so nothing can
  // re-enter the pair before its outcome is booked
  const ExecutionAttempt &done = attempt;
  for (auto &obs : observers) {
    try {
      obs(done);
    } catch (const std::exception &e) {
      spdlog::error("[Legging] Observer failed on {}: {}", attempt.id, e.what());
    }
  }

  std::lock_guard<std::mutex> lock(mtx_);
  auto it = flights_.find(attempt.opportunity.pair_key);
  if (it != flights_.end() && it->second.attempt.id == attempt.id) {
    if (it->second.future.valid())
      finished_.push_back(std::move(it->second.future));
    flights_.erase(it);
  }
}

void LeggingCoordinator::reap() {
  std::vector<std::shared_future<ExecutionAttempt>> done;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    done.swap(finished_);
  }
  // destroyed here, outside the lock
}

// ── Venue calls ──────────────────────────────────────────────────────
OrderHandle LeggingCoordinator::sendLeg(const LegRecord &leg) {
  const auto &plan = leg.plan;
  if (plan.kind == VenueKind::EXCHANGE) {
    ExchangeClient *ex = venues_.exchange();
    if (!ex)
      throw RejectedOrder("No exchange client for " + plan.venue);
    return ex->placeOrder(plan.instrument_id, Side::BUY, plan.price,
                          leg.requested_size, leg.client_order_id);
  }

  OddsVenueClient *client = venues_.odds(plan.venue);
  if (!client)
    throw RejectedOrder("No client for odds venue " + plan.venue);

  BetRequest req;
  req.line_id = plan.instrument_id;
  req.event_id = plan.event_id;
  req.side = plan.side;
  req.outcome = plan.outcome;
  req.american_odds =
      plan.format == PriceFormat::AMERICAN
          ? plan.price
          : odds::impliedToAmerican(odds::toImplied(plan.price, plan.format));
  req.units = leg.requested_size;
  req.stake_usd = odds::stakeForUnits(plan.price, plan.format, req.units);
  req.client_ref = leg.client_order_id;
  return client->placeBet(req);
}

std::optional<OrderHandle> LeggingCoordinator::findLeg(const LegRecord &leg) {
  const auto &plan = leg.plan;
  if (plan.kind == VenueKind::EXCHANGE)
    return venues_.exchange()->findOrder(plan.instrument_id,
                                         leg.client_order_id);
  return venues_.odds(plan.venue)->findBet(leg.client_order_id);
}

OrderHandle LeggingCoordinator::placeLeg(const LegRecord &leg) {
  const auto &plan = leg.plan;
  std::string label = "place " + plan.venue + " " + plan.instrument_id;

  bool sent = false;
  auto once = [&]() -> OrderHandle {
    if (sent) {
      if (auto found = findLeg(leg)) {
        spdlog::warn("[Legging] {} reached {} despite the failed reply, "
                     "tracking {}",
                     leg.client_order_id, plan.venue, found->order_id);
        return *found;
      }
    }
    sent = true;
    return sendLeg(leg);
  };

  try {
    return withRetry(once, config_.retry, label);
  } catch (const TransientVenueError &e) {
    // Could be resting on the venue with no handle on our side
    spdlog::critical("🚨 [Legging] {} on {} in unknown state: {}",
                     leg.client_order_id, plan.venue, e.what());
    if (alerts_)
      alerts_->notify(Severity::CRITICAL, "Order state unknown after placement",
                      {{"error", "OrderStateUnknown"},
                       {"client_order_id", leg.client_order_id},
                       {"venue", plan.venue},
                       {"instrument", plan.instrument_id},
                       {"reason", e.what()}});
    throw;
  }
}

OrderStatus LeggingCoordinator::pollLeg(const LegRecord &leg,
                                        const OrderHandle &handle) {
  std::string label = "status " + leg.plan.venue + " " + handle.order_id;
  if (leg.plan.kind == VenueKind::EXCHANGE) {
    ExchangeClient *ex = venues_.exchange();
    return withRetry([&] { return ex->getOrderStatus(handle); }, config_.retry,
                     label);
  }
  OddsVenueClient *client = venues_.odds(leg.plan.venue);
  return withRetry([&] { return client->getBetStatus(handle); }, config_.retry,
                   label);
}

void LeggingCoordinator::cancelLeg(const LegRecord &leg,
                                   const OrderHandle &handle) {
  try {
    if (leg.plan.kind == VenueKind::EXCHANGE)
      venues_.exchange()->cancelOrder(handle);
    else
      venues_.odds(leg.plan.venue)->cancelBet(handle);
  } catch (const std::exception &e) {
    spdlog::warn("[Legging] Cancel of {} on {} failed: {}", handle.order_id,
                 leg.plan.venue, e.what());
  }
}

// ── One leg ──────────────────────────────────────────────────────────
void LeggingCoordinator::executeLeg(ExecutionAttempt &attempt, LegRecord &leg,
                                    int timeout_ms, bool cancellable) {
  leg.requested_size = leg.plan.size;
  leg.client_order_id = fmt::format("xarb-{}-{}-L{}", session_, attempt.id,
                                    &leg == &attempt.leg1 ? 1 : 2);
  leg.submitted_at = Clock::now();
  leg.state = LegState::SUBMITTED;

  OrderHandle handle;
  try {
    handle = placeLeg(leg);
  } catch (const std::exception &e) {
    // RejectedOrder, or retries exhausted: either way nothing rests
    leg.state = LegState::REJECTED;
    leg.error = e.what();
    leg.completed_at = Clock::now();
    spdlog::warn("[Legging] {} {} rejected: {}", attempt.id, leg.plan.venue,
                 leg.error);
    publish(attempt);
    return;
  }
  leg.order_id = handle.order_id;
  publish(attempt);

  auto apply = [&](const OrderStatus &st) {
    leg.filled_size = std::min(st.filled_size, leg.requested_size);
    if (st.avg_price != 0.0)
      leg.avg_price = st.avg_price;
  };
  // Cancel what rests and read the final fill
  auto closeOut = [&]() {
    cancelLeg(leg, handle);
    try {
      apply(pollLeg(leg, handle));
    } catch (const std::exception &e) {
      spdlog::warn("[Legging] {} final status on {} unavailable: {}",
                   attempt.id, leg.plan.venue, e.what());
    }
  };

  auto start = std::chrono::steady_clock::now();
  while (true) {
    try {
      OrderStatus st = pollLeg(leg, handle);
      apply(st);
      publish(attempt);

      if (st.state == LegState::FILLED ||
          leg.filled_size >= leg.requested_size - kUnitEps) {
        leg.state = LegState::FILLED;
        break;
      }
      if (st.state == LegState::REJECTED || st.state == LegState::CANCELLED) {
        leg.state = leg.filled_size > kUnitEps ? LegState::PARTIALLY_FILLED
                                               : st.state;
        leg.error = std::string("closed by venue: ") + toString(st.state);
        break;
      }
    } catch (const std::exception &e) {
      spdlog::warn("[Legging] {} status poll on {} failed: {}", attempt.id,
                   leg.plan.venue, e.what());
    }

    if (cancellable && leg.filled_size <= kUnitEps &&
        cancelRequested(attempt.opportunity.pair_key)) {
      closeOut();
      // a fill that raced the cancel is kept and hedged
      leg.state = leg.filled_size > kUnitEps ? LegState::PARTIALLY_FILLED
                                             : LegState::CANCELLED;
      break;
    }

    if (elapsed_ms(start) >= timeout_ms) {
      closeOut();
      if (leg.filled_size >= leg.requested_size - kUnitEps)
        leg.state = LegState::FILLED;
      else if (leg.filled_size > kUnitEps)
        leg.state = LegState::PARTIALLY_FILLED;
      else
        leg.state = LegState::TIMED_OUT;
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(config_.poll_interval_ms));
  }

  leg.completed_at = Clock::now();
  spdlog::info("[Legging] {} {} {}: {:.0f}/{:.0f} @ {:.4f}", attempt.id,
               leg.plan.venue, toString(leg.state), leg.filled_size,
               leg.requested_size, leg.avg_price);
  publish(attempt);
}

// ── State machine ────────────────────────────────────────────────────
ExecutionAttempt LeggingCoordinator::run(ExecutionAttempt attempt) {
  const std::string &key = attempt.opportunity.pair_key;
  spdlog::info("[Legging] {} start: leg1 {} x{:.0f}, leg2 {}, edge {:.4f}",
               attempt.id, attempt.leg1.plan.venue, attempt.leg1.plan.size,
               attempt.leg2.plan.venue, attempt.planned_edge);

  if (cancelRequested(key)) {
    transition(attempt, AttemptState::ABANDONED);
    finish(attempt);
    return attempt;
  }

  // ── Leg 1 ──
  transition(attempt, AttemptState::LEG1_SUBMITTED);
  executeLeg(attempt, attempt.leg1, config_.leg1_timeout_ms, true);

  switch (attempt.leg1.state) {
  case LegState::FILLED:
    transition(attempt, AttemptState::LEG1_FILLED);
    break;
  case LegState::PARTIALLY_FILLED:
    transition(attempt, AttemptState::LEG1_PARTIAL_FILL);
    break;
  case LegState::REJECTED:
    transition(attempt, AttemptState::LEG1_REJECTED);
    break;
  case LegState::TIMED_OUT:
    transition(attempt, AttemptState::LEG1_TIMED_OUT);
    break;
  default:
    break; // cancelled before any fill
  }

  if (attempt.leg1.filled_size <= kUnitEps) {
    transition(attempt, AttemptState::ABANDONED);
    spdlog::info("[Legging] {} abandoned, Leg2 not sent", attempt.id);
    finish(attempt);
    return attempt;
  }

  // ── Leg 2, sized to what Leg1 actually got ──
  attempt.leg2.plan.size = attempt.leg1.filled_size;
  transition(attempt, AttemptState::LEG2_SUBMITTED);
  executeLeg(attempt, attempt.leg2, config_.leg2_timeout_ms, false);

  switch (attempt.leg2.state) {
  case LegState::FILLED:
    transition(attempt, AttemptState::BOTH_FILLED);
    break;
  case LegState::PARTIALLY_FILLED:
    transition(attempt, AttemptState::LEG2_PARTIAL_FILL);
    break;
  case LegState::TIMED_OUT:
    transition(attempt, AttemptState::LEG2_TIMED_OUT);
    transition(attempt, AttemptState::NAKED_EXPOSURE);
    break;
  default:
    transition(attempt, AttemptState::LEG2_REJECTED);
    transition(attempt, AttemptState::NAKED_EXPOSURE);
    break;
  }

  settleOutcome(attempt);
  finish(attempt);
  return attempt;
}

void LeggingCoordinator::settleOutcome(ExecutionAttempt &attempt) {
  const LegRecord &l1 = attempt.leg1;
  const LegRecord &l2 = attempt.leg2;
  attempt.hedged_units = std::min(l1.filled_size, l2.filled_size);
  attempt.unhedged_units = std::max(0.0, l1.filled_size - l2.filled_size);

  if (attempt.hedged_units > kUnitEps) {
    const LegRecord &ex = l1.plan.kind == VenueKind::EXCHANGE ? l1 : l2;
    const LegRecord &od = l1.plan.kind == VenueKind::EXCHANGE ? l2 : l1;
    const VenueConfig *exv = config_.venue(ex.plan.venue);
    const VenueConfig *odv = config_.venue(od.plan.venue);
    FeeModel exf = exv ? exv->fees : FeeModel{};
    FeeModel odf = odv ? odv->fees : FeeModel{};

    // Cash actually paid per unit, both legs
    double ex_unit = odds::legOutlayUsd(ex, exf) / ex.filled_size;
    double od_unit = odds::legOutlayUsd(od, odf) / od.filled_size;
    attempt.realized_pnl = attempt.hedged_units * (1.0 - ex_unit - od_unit);

    // Planned edge moved by the price slippage on each leg
    auto unitCost = [](const LegRecord &leg, double price, const FeeModel &f) {
      return odds::feeAdjustedCost(odds::toImplied(price, leg.plan.format), f);
    };
    auto achieved = [](const LegRecord &leg) {
      return leg.avg_price != 0.0 ? leg.avg_price : leg.plan.price;
    };
    double slip = (unitCost(ex, achieved(ex), exf) -
                   unitCost(ex, ex.plan.price, exf)) +
                  (unitCost(od, achieved(od), odf) -
                   unitCost(od, od.plan.price, odf));
    attempt.realized_edge = attempt.planned_edge - slip;
  }

  if (attempt.state == AttemptState::NAKED_EXPOSURE) {
    NakedExposureError err(
        fmt::format("NAKED EXPOSURE on {}: {:.0f} units filled on {}, hedge "
                    "on {} failed ({})",
                    attempt.opportunity.pair_key, l1.filled_size, l1.plan.venue,
                    l2.plan.venue, l2.error.empty() ? toString(l2.state) : l2.error),
        attempt.id, attempt.unhedged_units);
    spdlog::critical("🚨 [Legging] {}", err.what());
    if (alerts_)
      alerts_->notify(Severity::CRITICAL, err.what(),
                      {{"error", "NakedExposureError"},
                       {"attempt_id", err.attemptId()},
                       {"units", fmt::format("{:.0f}", err.units())},
                       {"venue", l1.plan.venue},
                       {"instrument", l1.plan.instrument_id},
                       {"pair_key", attempt.opportunity.pair_key}});
    return;
  }

  if (attempt.unhedged_units > kUnitEps) {
    spdlog::warn("[Legging] {} hedged {:.0f}/{:.0f}, {:.0f} residual on {}",
                 attempt.id, attempt.hedged_units, l1.filled_size,
                 attempt.unhedged_units, l1.plan.venue);
    if (alerts_)
      alerts_->notify(Severity::WARNING, "Partial hedge left residual units",
                      {{"attempt_id", attempt.id},
                       {"units", fmt::format("{:.0f}", attempt.unhedged_units)},
                       {"venue", l1.plan.venue}});
  } else {
    spdlog::info("[Legging] {} both filled: {:.0f} units, edge {:.4f} → {:.4f}, "
                 "locked ${:.2f}",
                 attempt.id, attempt.hedged_units, attempt.planned_edge,
                 attempt.realized_edge, attempt.realized_pnl);
  }
}

} // namespace xarb
