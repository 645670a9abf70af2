#include "xarb/scanner.hpp"
#include "xarb/errors.hpp"
#include "xarb/retry.hpp"
#include <set>
#include <spdlog/spdlog.h>
#include <thread>

using json = nlohmann::json;

namespace xarb {

Scanner::Scanner(const Config &config, VenueRegistry &venues,
                 PortfolioManager &portfolio, RiskManager &risk,
                 LeggingCoordinator &coordinator, RecordSink *journal,
                 AlertSink *alerts)
    : config_(config), venues_(venues), portfolio_(portfolio), risk_(risk),
      coordinator_(coordinator), journal_(journal), alerts_(alerts),
      matcher_(config), detector_(config, &risk, &venues),
      book_(config.edge_noise, config.stale_ms) {
  // Book first so the risk manager sees the updated P&L. The observers hold
  // the collaborators, not the scanner, so attempts may outlive it.
  coordinator_.addObserver([&portfolio](const ExecutionAttempt &a) {
    portfolio.recordAttempt(a);
  });
  coordinator_.addObserver(
      [&risk](const ExecutionAttempt &a) { risk.onAttemptFinished(a); });
  if (journal)
    coordinator_.addObserver(
        [journal](const ExecutionAttempt &a) { journal->recordAttempt(a); });
}

// ── Fetch ────────────────────────────────────────────────────────────
std::vector<OddsLine> Scanner::fetchLines(const std::vector<MarketType> &types,
                                          int &skipped) {
  std::vector<OddsLine> lines;
  for (const auto &venue_id : venues_.oddsVenueIds()) {
    OddsVenueClient *client = venues_.odds(venue_id);
    for (const auto &sport : config_.sports) {
      try {
        auto got = withRetry(
            [&] { return client->getLines(sport, config_.regions, types); },
            config_.retry, "lines " + venue_id + " " + sport);
        lines.insert(lines.end(), got.begin(), got.end());
      } catch (const ConfigurationError &) {
        throw;
      } catch (const std::exception &e) {
        spdlog::error("[Scanner] {} {} unavailable: {}", venue_id, sport,
                      e.what());
        skipped++;
      }
    }
  }
  return lines;
}

// ── One cycle ────────────────────────────────────────────────────────
CycleReport Scanner::runCycle(Timestamp now) {
  auto cycle_start = std::chrono::steady_clock::now();
  CycleReport report;
  ScanRecord &rec = report.record;
  rec.cycle = ++cycle_;
  rec.at = now;

  portfolio_.rollDay(now);
  risk_.evaluateKillSwitch();

  auto finishRecord = [&]() {
    rec.elapsed_ms = elapsed_ms(cycle_start);
    if (journal_)
      journal_->recordScan(rec);
    spdlog::info("── Cycle {} ── instruments={} lines={} pairs={} opps={} "
                 "dispatched={} skipped={} elapsed={:.1f}ms ──",
                 rec.cycle, rec.instruments, rec.lines, rec.pairs,
                 rec.opportunities, rec.dispatched, rec.skipped, rec.elapsed_ms);
  };

  // ── Step 1: Snapshots ─────────────────────────────────────────────
  ExchangeClient *exchange = venues_.exchange();
  if (!exchange)
    throw ConfigurationError("No exchange client registered");

  std::vector<Instrument> instruments;
  try {
    InstrumentFilter filter;
    filter.categories = config_.sports;
    instruments = withRetry([&] { return exchange->getInstruments(filter); },
                            config_.retry, "instruments");
  } catch (const ConfigurationError &) {
    throw;
  } catch (const std::exception &e) {
    spdlog::error("[Scanner] Exchange unavailable, skipping cycle: {}",
                  e.what());
    rec.skipped++;
    book_.replace({});
    finishRecord();
    return report;
  }
  rec.instruments = static_cast<int>(instruments.size());

  // Only ask for the line types some instrument can pair with
  std::set<MarketType> wanted;
  for (const auto &inst : instruments) {
    for (auto t : {MarketType::MONEYLINE, MarketType::SPREADS, MarketType::TOTALS})
      if (MarketMatcher::compatible(inst.type, t))
        wanted.insert(t);
  }
  std::vector<MarketType> types(wanted.begin(), wanted.end());
  std::vector<OddsLine> lines;
  if (!types.empty())
    lines = fetchLines(types, rec.skipped);
  rec.lines = static_cast<int>(lines.size());

  // ── Step 2: Match ─────────────────────────────────────────────────
  auto pairs = matcher_.match(instruments, lines);
  rec.pairs = static_cast<int>(pairs.size());

  // ── Step 3: Detect ────────────────────────────────────────────────
  auto exposure = portfolio_.snapshot();
  for (const auto &pair : pairs) {
    try {
      auto book = withRetry([&] { return exchange->getOrderBook(pair.key()); },
                            config_.retry, "orderbook " + pair.key());
      if (auto opp = detector_.evaluate(pair, book, exposure, Clock::now()))
        report.detected.push_back(std::move(*opp));
    } catch (const StaleData &e) {
      spdlog::warn("[Scanner] {} skipped: {}", pair.key(), e.what());
      rec.skipped++;
    } catch (const ConfigurationError &) {
      throw;
    } catch (const std::exception &e) {
      spdlog::warn("[Scanner] {} skipped: {}", pair.key(), e.what());
      rec.skipped++;
    }
  }
  rec.opportunities = static_cast<int>(report.detected.size());

  auto emitted = book_.replace(report.detected);
  rec.emitted = static_cast<int>(emitted.size());
  for (const auto &opp : emitted) {
    if (journal_)
      journal_->recordOpportunity(opp);
    if (!opp.executable && alerts_)
      alerts_->notify(Severity::INFO, "Alert-only opportunity",
                      {{"pair_key", opp.pair_key},
                       {"venue", opp.hedge_venue},
                       {"edge", std::to_string(opp.edge)},
                       {"plan", opp.description}});
  }

  // ── Step 4: Filter and dispatch ───────────────────────────────────
  if (risk_.halted()) {
    spdlog::warn("[Scanner] Halted ({}), nothing dispatched",
                 risk_.haltReason());
    finishRecord();
    return report;
  }

  for (const auto &candidate : book_.current()) {
    if (!candidate.executable || coordinator_.inFlight(candidate.pair_key))
      continue;
    auto opp = book_.take(candidate.pair_key, Clock::now());
    if (!opp)
      continue;

    auto decision = risk_.checkAndReserve(*opp);
    if (!decision.approved)
      continue;

    auto fut = coordinator_.submit(*opp, Clock::now());
    if (!fut) {
      portfolio_.releaseReservation(opp->pair_key);
      continue;
    }
    report.dispatched.push_back(*fut);
    rec.dispatched++;
  }

  finishRecord();
  return report;
}

// ── Loop ─────────────────────────────────────────────────────────────
void Scanner::run(const std::function<bool()> &keep_running) {
  while (keep_running()) {
    auto start = std::chrono::steady_clock::now();
    try {
      runCycle();
    } catch (const ConfigurationError &e) {
      spdlog::critical("[Scanner] Configuration error, stopping: {}", e.what());
      throw;
    } catch (const std::exception &e) {
      spdlog::error("[Scanner] Cycle {} failed: {}", cycle_.load(), e.what());
    }

    // Sleep out the interval in short steps so shutdown stays responsive
    while (keep_running() && elapsed_ms(start) < config_.scan_interval_ms)
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  spdlog::info("[Scanner] Stopped after {} cycles", cycle_.load());
}

// ── Dashboard ────────────────────────────────────────────────────────
DashboardSnapshot Scanner::snapshot() const {
  DashboardSnapshot s;
  s.at = Clock::now();
  s.cycle = cycle_.load();
  s.halted = risk_.halted();
  s.halt_reason = risk_.haltReason();
  s.opportunities = book_.current();
  s.open_attempts = coordinator_.openAttempts();
  s.exposure = portfolio_.snapshot();
  s.unhedged = portfolio_.unhedgedPositions();
  return s;
}

json DashboardSnapshot::toJson() const {
  json j;
  j["at"] = isoTimestamp(at);
  j["cycle"] = cycle;
  j["halted"] = halted;
  j["halt_reason"] = halt_reason;
  j["cumulative_pnl"] = exposure.cumulative_pnl;
  j["daily_realized_pnl"] = exposure.daily_realized_pnl;
  j["high_water_mark"] = exposure.high_water_mark;
  j["total_open_usd"] = exposure.totalOpenUsd();

  j["opportunities"] = json::array();
  for (const auto &o : opportunities)
    j["opportunities"].push_back({{"pair_key", o.pair_key},
                                  {"hedge_venue", o.hedge_venue},
                                  {"edge", o.edge},
                                  {"max_size", o.max_size},
                                  {"executable", o.executable},
                                  {"detected_at", isoTimestamp(o.detected_at)},
                                  {"plan", o.description}});

  j["open_attempts"] = json::array();
  for (const auto &a : open_attempts)
    j["open_attempts"].push_back({{"id", a.id},
                                  {"pair_key", a.opportunity.pair_key},
                                  {"state", toString(a.state)},
                                  {"leg1_filled", a.leg1.filled_size},
                                  {"leg2_filled", a.leg2.filled_size}});

  j["venues"] = json::array();
  for (const auto &[id, v] : exposure.venues)
    j["venues"].push_back({{"venue", id},
                           {"open_position_usd", v.open_position_usd},
                           {"reserved_usd", v.reserved_usd},
                           {"daily_volume_usd", v.daily_volume_usd},
                           {"daily_realized_pnl", v.daily_realized_pnl},
                           {"flagged", v.flagged},
                           {"flag_reason", v.flag_reason}});

  j["unhedged"] = json::array();
  for (const auto &p : unhedged)
    j["unhedged"].push_back({{"id", p.id},
                             {"pair_key", p.pair_key},
                             {"venue", p.unhedged_venue},
                             {"units", p.unhedged_units},
                             {"cost_usd", p.unhedged_cost_usd}});
  return j;
}

} // namespace xarb
