#include "xarb/portfolio_manager.hpp"
#include "xarb/errors.hpp"
#include "xarb/odds.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace xarb {

static constexpr double kUnitEps = 1e-9;

PortfolioManager::PortfolioManager(const Config &config) : config_(config) {
  for (const auto &v : config_.venues)
    state_.venues[v.id].venue = v.id;
  state_.day = utcDay(Clock::now());
}

// ── Reads ────────────────────────────────────────────────────────────
ExposureState PortfolioManager::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

std::vector<Position> PortfolioManager::positions() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return positions_;
}

std::vector<Position> PortfolioManager::unhedgedPositions() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Position> out;
  for (const auto &p : positions_)
    if (p.open && !p.hedged)
      out.push_back(p);
  return out;
}

double PortfolioManager::reservedUsd(const std::string &pair_key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = reservations_.find(pair_key);
  if (it == reservations_.end())
    return 0.0;
  double total = 0.0;
  for (const auto &[venue, usd] : it->second)
    total += usd;
  return total;
}

void PortfolioManager::requireFlat() const {
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto &p : positions_) {
    if (p.open && p.unhedged_units > kUnitEps)
      throw NakedExposureError("Unhedged position " + p.id + " on " +
                                   p.unhedged_venue,
                               p.id, p.unhedged_units);
  }
}

// ── Internals (caller holds mtx_) ───────────────────────────────────
VenueExposure &PortfolioManager::venueLocked(const std::string &venue) {
  auto &v = state_.venues[venue];
  v.venue = venue;
  return v;
}

void PortfolioManager::rollDayLocked(Timestamp now) {
  long day = utcDay(now);
  if (day <= state_.day)
    return;
  spdlog::info("[Portfolio] UTC day rolled, realized today was ${:.2f}",
               state_.daily_realized_pnl);
  state_.day = day;
  state_.daily_realized_pnl = 0.0;
  for (auto &[id, v] : state_.venues) {
    v.daily_volume_usd = 0.0;
    v.daily_realized_pnl = 0.0;
  }
}

void PortfolioManager::bookPnlLocked(const std::string &venue, double pnl) {
  state_.daily_realized_pnl += pnl;
  state_.cumulative_pnl += pnl;
  state_.high_water_mark = std::max(state_.high_water_mark, state_.cumulative_pnl);
  venueLocked(venue).daily_realized_pnl += pnl;
}

Position *PortfolioManager::findLocked(const std::string &id) {
  for (auto &p : positions_)
    if (p.id == id)
      return &p;
  return nullptr;
}

// ── Writes ───────────────────────────────────────────────────────────
void PortfolioManager::rollDay(Timestamp now) {
  std::lock_guard<std::mutex> lock(mtx_);
  rollDayLocked(now);
}

std::optional<std::string>
PortfolioManager::reserveIf(const Opportunity &opp, const Check &check) {
  std::lock_guard<std::mutex> lock(mtx_);
  rollDayLocked(Clock::now());

  if (reservations_.count(opp.pair_key))
    return "reservation already held for " + opp.pair_key;
  if (auto reason = check(state_))
    return reason;

  auto &held = reservations_[opp.pair_key];
  for (const auto &leg : opp.legs) {
    double usd = odds::stakeForUnits(leg.price, leg.format, leg.size);
    held[leg.venue] += usd;
    venueLocked(leg.venue).reserved_usd += usd;
  }
  return std::nullopt;
}

void PortfolioManager::releaseReservation(const std::string &pair_key) {
  std::lock_guard<std::mutex> lock(mtx_);
  releaseLocked(pair_key);
}

void PortfolioManager::releaseLocked(const std::string &pair_key) {
  auto it = reservations_.find(pair_key);
  if (it == reservations_.end())
    return;
  for (const auto &[venue, usd] : it->second) {
    auto &v = venueLocked(venue);
    v.reserved_usd = std::max(0.0, v.reserved_usd - usd);
  }
  reservations_.erase(it);
}

void PortfolioManager::recordAttempt(const ExecutionAttempt &attempt) {
  std::lock_guard<std::mutex> lock(mtx_);
  releaseLocked(attempt.opportunity.pair_key);
  rollDayLocked(attempt.finished_at);

  const LegRecord *legs[] = {&attempt.leg1, &attempt.leg2};
  double exchange_usd = 0.0, hedge_usd = 0.0;
  std::string exchange_venue, hedge_venue;

  for (const LegRecord *leg : legs) {
    const VenueConfig *vc = config_.venue(leg->plan.venue);
    double usd = odds::legOutlayUsd(*leg, vc ? vc->fees : FeeModel{});
    if (leg->plan.kind == VenueKind::EXCHANGE) {
      exchange_usd = usd;
      exchange_venue = leg->plan.venue;
    } else {
      hedge_usd = usd;
      hedge_venue = leg->plan.venue;
    }
    if (usd <= 0.0)
      continue;
    auto &v = venueLocked(leg->plan.venue);
    v.daily_volume_usd += usd;
    v.open_position_usd += usd;
    v.last_activity = attempt.finished_at;
  }

  if (std::find(attempt.history.begin(), attempt.history.end(),
                AttemptState::LEG2_REJECTED) != attempt.history.end())
    venueLocked(attempt.leg2.plan.venue).leg2_rejections++;

  if (attempt.hedged_units + attempt.unhedged_units <= kUnitEps)
    return;

  Position p;
  p.id = attempt.id;
  p.pair_key = attempt.opportunity.pair_key;
  p.exchange_venue = exchange_venue;
  p.hedge_venue = hedge_venue;
  p.hedged_units = attempt.hedged_units;
  p.unhedged_units = attempt.unhedged_units;
  p.exchange_cost_usd = exchange_usd;
  p.hedge_stake_usd = hedge_usd;
  p.locked_pnl = attempt.realized_pnl;
  p.hedged = attempt.unhedged_units <= kUnitEps;
  p.open = true;
  p.opened_at = attempt.finished_at;
  if (!p.hedged) {
    // Leg2 is sized off Leg1's fill, so any residual sits on Leg1
    const LegRecord &l1 = attempt.leg1;
    double l1_usd = l1.plan.kind == VenueKind::EXCHANGE ? exchange_usd : hedge_usd;
    p.unhedged_venue = l1.plan.venue;
    p.unhedged_cost_usd =
        l1.filled_size > 0.0 ? l1_usd * attempt.unhedged_units / l1.filled_size
                             : 0.0;
  }
  positions_.push_back(p);

  bookPnlLocked(hedge_venue.empty() ? exchange_venue : hedge_venue,
                attempt.realized_pnl);

  if (p.hedged) {
    spdlog::info("[Portfolio] {} booked: {:.0f} units hedged, locked ${:.2f}",
                 p.id, p.hedged_units, p.locked_pnl);
  } else {
    spdlog::critical("[Portfolio] {} UNHEDGED: {:.0f} units on {} (${:.2f} at risk)",
                     p.id, p.unhedged_units, p.unhedged_venue,
                     p.unhedged_cost_usd);
  }
}

bool PortfolioManager::settlePosition(const std::string &id, double payout_usd) {
  std::lock_guard<std::mutex> lock(mtx_);
  Position *p = findLocked(id);
  if (!p || !p->open)
    return false;

  double residual =
      payout_usd - (p->exchange_cost_usd + p->hedge_stake_usd) - p->locked_pnl;
  bookPnlLocked(p->unhedged_venue.empty() ? p->hedge_venue : p->unhedged_venue,
                residual);

  auto &ex = venueLocked(p->exchange_venue);
  ex.open_position_usd = std::max(0.0, ex.open_position_usd - p->exchange_cost_usd);
  if (!p->hedge_venue.empty()) {
    auto &hv = venueLocked(p->hedge_venue);
    hv.open_position_usd = std::max(0.0, hv.open_position_usd - p->hedge_stake_usd);
  }
  p->open = false;
  spdlog::info("[Portfolio] {} settled: payout ${:.2f}, total P&L ${:.2f}", id,
               payout_usd, p->locked_pnl + residual);
  return true;
}

bool PortfolioManager::recordUnwind(const std::string &id, double proceeds_usd) {
  std::lock_guard<std::mutex> lock(mtx_);
  Position *p = findLocked(id);
  if (!p || !p->open || p->unhedged_units <= kUnitEps)
    return false;

  double realized = proceeds_usd - p->unhedged_cost_usd;
  bookPnlLocked(p->unhedged_venue, realized);

  auto &v = venueLocked(p->unhedged_venue);
  v.open_position_usd = std::max(0.0, v.open_position_usd - p->unhedged_cost_usd);
  if (p->unhedged_venue == p->exchange_venue)
    p->exchange_cost_usd -= p->unhedged_cost_usd;
  else
    p->hedge_stake_usd -= p->unhedged_cost_usd;

  spdlog::warn("[Portfolio] {} unwound {:.0f} units on {} for ${:.2f} ({:+.2f})",
               id, p->unhedged_units, p->unhedged_venue, proceeds_usd, realized);
  p->unhedged_units = 0.0;
  p->unhedged_cost_usd = 0.0;
  p->hedged = true;
  if (p->hedged_units <= kUnitEps)
    p->open = false;
  return true;
}

void PortfolioManager::flagVenue(const std::string &venue,
                                 const std::string &reason) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto &v = venueLocked(venue);
  v.flagged = true;
  v.flag_reason = reason;
}

void PortfolioManager::clearVenueFlag(const std::string &venue) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto &v = venueLocked(venue);
  v.flagged = false;
  v.flag_reason.clear();
  v.leg2_rejections = 0;
}

// ── Persistence ──────────────────────────────────────────────────────
static long long toMs(Timestamp t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

static Timestamp fromMs(long long ms) {
  return Timestamp(std::chrono::milliseconds(ms));
}

static json venueToJson(const VenueExposure &v) {
  return {{"venue", v.venue},
          {"open_position_usd", v.open_position_usd},
          {"daily_volume_usd", v.daily_volume_usd},
          {"daily_realized_pnl", v.daily_realized_pnl},
          {"leg2_rejections", v.leg2_rejections},
          {"flagged", v.flagged},
          {"flag_reason", v.flag_reason},
          {"last_activity_ms", toMs(v.last_activity)}};
}

static json positionToJson(const Position &p) {
  return {{"id", p.id},
          {"pair_key", p.pair_key},
          {"exchange_venue", p.exchange_venue},
          {"hedge_venue", p.hedge_venue},
          {"hedged_units", p.hedged_units},
          {"unhedged_units", p.unhedged_units},
          {"exchange_cost_usd", p.exchange_cost_usd},
          {"hedge_stake_usd", p.hedge_stake_usd},
          {"unhedged_venue", p.unhedged_venue},
          {"unhedged_cost_usd", p.unhedged_cost_usd},
          {"locked_pnl", p.locked_pnl},
          {"hedged", p.hedged},
          {"open", p.open},
          {"opened_at_ms", toMs(p.opened_at)}};
}

void PortfolioManager::save(const std::string &path) const {
  json j;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    j["day"] = state_.day;
    j["daily_realized_pnl"] = state_.daily_realized_pnl;
    j["cumulative_pnl"] = state_.cumulative_pnl;
    j["high_water_mark"] = state_.high_water_mark;
    j["venues"] = json::array();
    for (const auto &[id, v] : state_.venues)
      j["venues"].push_back(venueToJson(v));
    j["positions"] = json::array();
    for (const auto &p : positions_)
      j["positions"].push_back(positionToJson(p));
  }

  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent);
  std::ofstream out(path, std::ios::trunc);
  if (!out)
    throw std::runtime_error("Cannot write portfolio state: " + path);
  out << j.dump(2) << "\n";
  spdlog::debug("[Portfolio] State saved to {}", path);
}

bool PortfolioManager::load(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    spdlog::info("[Portfolio] No saved state at {}, starting fresh", path);
    return false;
  }

  try {
    json j = json::parse(in);
    ExposureState st;
    st.day = j.value("day", 0L);
    st.daily_realized_pnl = j.value("daily_realized_pnl", 0.0);
    st.cumulative_pnl = j.value("cumulative_pnl", 0.0);
    st.high_water_mark = j.value("high_water_mark", 0.0);
    for (const auto &jv : j.value("venues", json::array())) {
      VenueExposure v;
      v.venue = jv.value("venue", "");
      v.open_position_usd = jv.value("open_position_usd", 0.0);
      v.daily_volume_usd = jv.value("daily_volume_usd", 0.0);
      v.daily_realized_pnl = jv.value("daily_realized_pnl", 0.0);
      v.leg2_rejections = jv.value("leg2_rejections", 0);
      v.flagged = jv.value("flagged", false);
      v.flag_reason = jv.value("flag_reason", "");
      v.last_activity = fromMs(jv.value("last_activity_ms", 0LL));
      if (!v.venue.empty())
        st.venues[v.venue] = v;
    }

    std::vector<Position> loaded;
    for (const auto &jp : j.value("positions", json::array())) {
      Position p;
      p.id = jp.value("id", "");
      p.pair_key = jp.value("pair_key", "");
      p.exchange_venue = jp.value("exchange_venue", "");
      p.hedge_venue = jp.value("hedge_venue", "");
      p.hedged_units = jp.value("hedged_units", 0.0);
      p.unhedged_units = jp.value("unhedged_units", 0.0);
      p.exchange_cost_usd = jp.value("exchange_cost_usd", 0.0);
      p.hedge_stake_usd = jp.value("hedge_stake_usd", 0.0);
      p.unhedged_venue = jp.value("unhedged_venue", "");
      p.unhedged_cost_usd = jp.value("unhedged_cost_usd", 0.0);
      p.locked_pnl = jp.value("locked_pnl", 0.0);
      p.hedged = jp.value("hedged", true);
      p.open = jp.value("open", true);
      p.opened_at = fromMs(jp.value("opened_at_ms", 0LL));
      loaded.push_back(p);
    }

    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto &v : config_.venues)
      st.venues[v.id].venue = v.id;
    state_ = std::move(st);
    positions_ = std::move(loaded);
    reservations_.clear();
    rollDayLocked(Clock::now());
    spdlog::info("[Portfolio] Loaded {} positions from {}", positions_.size(),
                 path);
    return true;
  } catch (const json::exception &e) {
    spdlog::warn("[Portfolio] Failed to load {}: {}. Starting fresh.", path,
                 e.what());
    return false;
  }
}

} // namespace xarb
