#include "xarb/risk_manager.hpp"
#include "xarb/odds.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace xarb {

static constexpr double kUsdEps = 1e-6;

RiskManager::RiskManager(const Config &config, PortfolioManager &portfolio,
                         AlertSink *alerts)
    : config_(config), portfolio_(portfolio), alerts_(alerts) {}

double RiskManager::perBetCap(const std::string &venue) const {
  const VenueConfig *vc = config_.venue(venue);
  double cap = vc ? vc->max_bet_usd : 0.0;
  return std::min(cap, config_.hard_max_leg_usd);
}

// ── Pre-trade checks ─────────────────────────────────────────────────
std::optional<std::string> RiskManager::check(const Opportunity &opp,
                                              const ExposureState &state) const {
  if (halted_.load())
    return "kill switch engaged: " + haltReason();

  for (const auto &leg : opp.legs) {
    auto it = state.venues.find(leg.venue);
    if (it != state.venues.end() && it->second.flagged)
      return fmt::format("venue {} flagged ({})", leg.venue,
                         it->second.flag_reason);
  }

  if (opp.max_size < config_.min_actionable_units)
    return fmt::format("size {:.0f} below minimum {:.0f}", opp.max_size,
                       config_.min_actionable_units);

  double new_usd = 0.0;
  for (const auto &leg : opp.legs) {
    double stake = odds::stakeForUnits(leg.price, leg.format, leg.size);
    new_usd += stake;

    const VenueConfig *vc = config_.venue(leg.venue);
    if (!vc)
      return "no configuration for venue " + leg.venue;

    if (stake > perBetCap(leg.venue) + kUsdEps)
      return fmt::format("{} stake ${:.2f} over per-bet cap ${:.2f}", leg.venue,
                         stake, perBetCap(leg.venue));

    double used = 0.0;
    auto it = state.venues.find(leg.venue);
    if (it != state.venues.end())
      used = it->second.daily_volume_usd + it->second.reserved_usd;
    if (used + stake > vc->max_daily_volume_usd + kUsdEps)
      return fmt::format("{} daily volume ${:.2f} + ${:.2f} over cap ${:.2f}",
                         leg.venue, used, stake, vc->max_daily_volume_usd);
  }

  if (state.totalOpenUsd() + new_usd > config_.max_global_exposure_usd + kUsdEps)
    return fmt::format("global exposure ${:.2f} + ${:.2f} over cap ${:.2f}",
                       state.totalOpenUsd(), new_usd,
                       config_.max_global_exposure_usd);

  double worst = opp.worstCaseLossUsd();
  if (state.daily_realized_pnl - worst < -config_.max_daily_loss_usd)
    return fmt::format("daily P&L ${:.2f} minus worst case ${:.2f} breaches "
                       "loss limit ${:.2f}",
                       state.daily_realized_pnl, worst,
                       config_.max_daily_loss_usd);

  return std::nullopt;
}

RiskDecision RiskManager::checkAndReserve(const Opportunity &opp) {
  // Settlements and unwinds book P&L outside the attempt flow
  evaluateKillSwitch();
  if (halted_.load())
    return {false, "kill switch engaged: " + haltReason()};

  auto reason = portfolio_.reserveIf(
      opp, [&](const ExposureState &state) { return check(opp, state); });
  if (reason) {
    spdlog::warn("[Risk] {} rejected: {}", opp.pair_key, *reason);
    return {false, *reason};
  }
  spdlog::debug("[Risk] {} approved, ${:.2f} reserved", opp.pair_key,
                portfolio_.reservedUsd(opp.pair_key));
  return {true, ""};
}

// ── Venue rotation ───────────────────────────────────────────────────
std::vector<std::string>
RiskManager::rankVenues(const std::vector<std::string> &candidates) const {
  auto state = portfolio_.snapshot();

  struct Rank {
    std::string venue;
    bool flagged;
    double headroom;
    Timestamp last_activity;
    double per_bet;
  };
  std::vector<Rank> ranks;
  for (const auto &id : candidates) {
    Rank r{id, false, 0.0, Timestamp{}, perBetCap(id)};
    const VenueConfig *vc = config_.venue(id);
    double daily = vc ? vc->max_daily_volume_usd : 0.0;
    auto it = state.venues.find(id);
    if (it != state.venues.end()) {
      r.flagged = it->second.flagged;
      r.headroom = daily - it->second.daily_volume_usd - it->second.reserved_usd;
      r.last_activity = it->second.last_activity;
    } else {
      r.headroom = daily;
    }
    ranks.push_back(r);
  }

  std::stable_sort(ranks.begin(), ranks.end(), [](const Rank &a, const Rank &b) {
    if (a.flagged != b.flagged)
      return !a.flagged;
    if (a.headroom != b.headroom)
      return a.headroom > b.headroom;
    if (a.last_activity != b.last_activity)
      return a.last_activity < b.last_activity;
    return a.per_bet > b.per_bet;
  });

  std::vector<std::string> out;
  for (const auto &r : ranks)
    out.push_back(r.venue);
  return out;
}

// ── Throttle detection ───────────────────────────────────────────────
void RiskManager::onAttemptFinished(const ExecutionAttempt &attempt) {
  bool leg2_rejected =
      std::find(attempt.history.begin(), attempt.history.end(),
                AttemptState::LEG2_REJECTED) != attempt.history.end();

  if (leg2_rejected) {
    const std::string &venue = attempt.leg2.plan.venue;
    Timestamp now = attempt.finished_at;
    auto window = std::chrono::seconds(config_.throttle_window_s);
    size_t count = 0;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto &hits = leg2_rejections_[venue];
      hits.push_back(now);
      while (!hits.empty() && now - hits.front() > window)
        hits.pop_front();
      count = hits.size();
    }
    spdlog::warn("[Risk] Leg2 rejection at {} ({} in last {}s)", venue, count,
                 config_.throttle_window_s);

    if (count >= static_cast<size_t>(config_.throttle_rejections)) {
      auto snap = portfolio_.snapshot();
      auto it = snap.venues.find(venue);
      bool already = it != snap.venues.end() && it->second.flagged;
      if (!already) {
        std::string reason = fmt::format("{} leg2 rejections within {}s", count,
                                         config_.throttle_window_s);
        portfolio_.flagVenue(venue, reason);
        spdlog::error("[Risk] Venue {} flagged as throttled: {}", venue, reason);
        if (alerts_)
          alerts_->notify(Severity::WARNING, "Venue flagged as throttled",
                          {{"venue", venue}, {"reason", reason}});
      }
    }
  }

  evaluateKillSwitch();
}

// ── Kill switch ──────────────────────────────────────────────────────
bool RiskManager::evaluateKillSwitch() {
  if (halted_.load())
    return true;

  auto state = portfolio_.snapshot();
  double drawdown = state.high_water_mark - state.cumulative_pnl;

  if (state.daily_realized_pnl <= -config_.max_daily_loss_usd) {
    trip(fmt::format("daily loss ${:.2f} reached limit ${:.2f}",
                     -state.daily_realized_pnl, config_.max_daily_loss_usd));
  } else if (drawdown >= config_.max_drawdown_usd) {
    trip(fmt::format("drawdown ${:.2f} from high-water mark ${:.2f} reached "
                     "limit ${:.2f}",
                     drawdown, state.high_water_mark, config_.max_drawdown_usd));
  }
  return halted_.load();
}

void RiskManager::trip(const std::string &reason) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (halted_.load())
      return;
    halt_reason_ = reason;
    halted_.store(true);
  }
  spdlog::critical("🛑 [Risk] KILL SWITCH: {}", reason);
  if (alerts_)
    alerts_->notify(Severity::CRITICAL, "Kill switch engaged",
                    {{"reason", reason}});
}

std::string RiskManager::haltReason() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return halt_reason_;
}

void RiskManager::resetKillSwitch() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (halted_.load())
    spdlog::warn("[Risk] Kill switch reset (was: {})", halt_reason_);
  halted_.store(false);
  halt_reason_.clear();
}

void RiskManager::clearVenueFlag(const std::string &venue) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    leg2_rejections_.erase(venue);
  }
  portfolio_.clearVenueFlag(venue);
  spdlog::info("[Risk] Venue {} flag cleared", venue);
}

} // namespace xarb
