#include "xarb/arb_detector.hpp"
#include "xarb/errors.hpp"
#include "xarb/odds.hpp"
#include "xarb/venue.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace xarb {

ArbDetector::ArbDetector(const Config &config, const VenueRanker *ranker,
                         const VenueRegistry *venues)
    : config_(config), ranker_(ranker), venues_(venues) {
  const VenueConfig *ex = config_.venue(config_.exchange_venue);
  if (!ex)
    throw ConfigurationError("No venue entry for exchange " +
                             config_.exchange_venue);
  exchange_ = *ex;
}

// ── Edge ─────────────────────────────────────────────────────────────
std::optional<LineEdge> ArbDetector::lineEdge(const PairedLine &line,
                                              const OrderBook &book) const {
  const VenueConfig *venue = config_.venue(line.line.venue);
  if (!venue || book.asks.empty())
    return std::nullopt;

  double ask = book.bestAsk();
  if (ask <= 0.0 || ask >= 1.0)
    return std::nullopt;

  Quote exq;
  exq.venue = exchange_.id;
  exq.instrument_id = book.ticker;
  exq.price = ask;
  exq.format = PriceFormat::PROBABILITY;
  exq.timestamp = book.timestamp;
  exq.available_size = book.bestAskSize();
  auto ex = odds::normalize(exq, exchange_.fees);

  // De-vig the two-way line, then take the venue's cut off the hedge side
  Eigen::VectorXd two_way(2);
  two_way << odds::toImplied(line.line.quote_a.price, line.line.quote_a.format),
      odds::toImplied(line.line.quote_b.price, line.line.quote_b.format);
  Eigen::VectorXd fair = odds::devigProportional(two_way);
  double q = fair[line.hedge_side == OutcomeSide::A ? 0 : 1];

  LineEdge le;
  le.line = &line;
  le.exchange_cost = ex.fee_adjusted;
  le.hedge_prob = odds::feeAdjustedImplied(q, venue->fees);
  le.edge = le.hedge_prob - le.exchange_cost;

  // Cash per unit both legs cost; one of them always pays out 1
  double hedge_raw = two_way[line.hedge_side == OutcomeSide::A ? 0 : 1];
  le.locked_margin =
      1.0 - le.exchange_cost - odds::feeAdjustedCost(hedge_raw, venue->fees);
  return le;
}

// ── Sizing ───────────────────────────────────────────────────────────
double ArbDetector::capUnits(const std::string &venue_id, double price_per_unit,
                             const ExposureState &exposure) const {
  const VenueConfig *venue = config_.venue(venue_id);
  if (!venue || price_per_unit <= 0.0)
    return 0.0;

  double used = 0.0;
  auto it = exposure.venues.find(venue_id);
  if (it != exposure.venues.end())
    used = it->second.daily_volume_usd + it->second.reserved_usd;

  double per_bet = std::min(venue->max_bet_usd, config_.hard_max_leg_usd);
  double daily_left = std::max(0.0, venue->max_daily_volume_usd - used);
  return std::min(per_bet, daily_left) / price_per_unit;
}

double ArbDetector::maxSize(const OrderBook &book, const PairedLine &line,
                            const ExposureState &exposure) const {
  const Quote &hedge = line.line.quote(line.hedge_side);
  double inf = std::numeric_limits<double>::infinity();

  double size = config_.max_units;
  size = std::min(size, book.bestAskSize());
  size = std::min(size, hedge.available_size > 0.0 ? hedge.available_size : inf);
  size = std::min(size, capUnits(exchange_.id, book.bestAsk(), exposure));
  size = std::min(size, capUnits(line.line.venue,
                                 odds::toImplied(hedge.price, hedge.format),
                                 exposure));
  // contracts are whole units
  return std::max(0.0, std::floor(size + 1e-9));
}

// ── Plan ─────────────────────────────────────────────────────────────
Opportunity ArbDetector::buildPlan(const MatchedPair &pair, const LineEdge &le,
                                   const OrderBook &book, double size,
                                   Timestamp now) const {
  const auto &inst = pair.instrument;
  const auto &line = *le.line;
  const Quote &hedge = line.line.quote(line.hedge_side);
  const VenueConfig *odds_venue = config_.venue(line.line.venue);

  LegPlan ex;
  ex.venue = exchange_.id;
  ex.kind = VenueKind::EXCHANGE;
  ex.instrument_id = inst.ticker;
  ex.event_id = inst.event_ticker;
  ex.side = OutcomeSide::A;
  ex.outcome = inst.outcome;
  ex.price = book.bestAsk();
  ex.format = PriceFormat::PROBABILITY;
  ex.size = size;

  LegPlan od;
  od.venue = line.line.venue;
  od.kind = VenueKind::ODDS;
  od.instrument_id = line.line.id();
  od.event_id = line.line.event_id;
  od.side = line.hedge_side;
  od.outcome = line.line.outcome(line.hedge_side);
  od.price = hedge.price;
  od.format = hedge.format;
  od.size = size;

  // Thinner leg first; ties go to the slower venue, then the exchange
  double inf = std::numeric_limits<double>::infinity();
  double ex_liq = book.bestAskSize();
  double od_liq = hedge.available_size > 0.0 ? hedge.available_size : inf;
  bool odds_first = false;
  if (od_liq < ex_liq)
    odds_first = true;
  else if (od_liq == ex_liq)
    odds_first = odds_venue &&
                 odds_venue->confirm_latency_ms > exchange_.confirm_latency_ms;

  Opportunity opp;
  opp.pair_key = pair.key();
  opp.hedge_venue = od.venue;
  opp.edge = le.edge;
  opp.max_size = size;
  opp.exchange_cost = le.exchange_cost;
  opp.hedge_prob = le.hedge_prob;
  opp.detected_at = now;
  opp.legs = odds_first ? std::vector<LegPlan>{od, ex}
                        : std::vector<LegPlan>{ex, od};
  opp.executable = !(odds_venue && odds_venue->read_only) &&
                   (!venues_ || venues_->canPlaceOrders(od.venue));
  opp.description = fmt::format("BUY {} YES @ {:.2f} | {} {} @ {:+.0f}",
                                inst.ticker, ex.price, od.venue, od.outcome,
                                od.format == PriceFormat::AMERICAN
                                    ? od.price
                                    : odds::impliedToAmerican(
                                          odds::toImplied(od.price, od.format)));
  return opp;
}

// ── Evaluate pair ────────────────────────────────────────────────────
std::optional<Opportunity> ArbDetector::evaluate(const MatchedPair &pair,
                                                 const OrderBook &book,
                                                 const ExposureState &exposure,
                                                 Timestamp now) const {
  double bound = config_.quote_freshness_ms;
  if (ageMs(book.timestamp, now) > bound)
    throw StaleData("Order book for " + pair.key() + " is " +
                    std::to_string(static_cast<long>(ageMs(book.timestamp, now))) +
                    "ms old");
  for (const auto &l : pair.lines) {
    for (const Quote *q : {&l.line.quote_a, &l.line.quote_b}) {
      if (ageMs(q->timestamp, now) > bound)
        throw StaleData("Line " + l.line.id() + " is stale");
    }
  }

  std::vector<LineEdge> clearing;
  for (const auto &l : pair.lines) {
    auto le = lineEdge(l, book);
    if (!le)
      continue;
    spdlog::debug("[Detect] {} via {}: a_adj={:.4f} q_adj={:.4f} edge={:+.4f} "
                  "locked={:+.4f}",
                  pair.key(), l.line.venue, le->exchange_cost, le->hedge_prob,
                  le->edge, le->locked_margin);
    if (le->edge < config_.min_edge)
      continue;
    if (le->locked_margin < config_.min_edge) {
      spdlog::debug("[Detect] {} via {} skipped: hedged pair locks {:+.4f}",
                    pair.key(), l.line.venue, le->locked_margin);
      continue;
    }
    clearing.push_back(*le);
  }
  if (clearing.empty())
    return std::nullopt;

  std::sort(clearing.begin(), clearing.end(),
            [](const LineEdge &a, const LineEdge &b) { return a.edge > b.edge; });
  const LineEdge *chosen = &clearing.front();

  // Venue rotation among near-equivalent edges
  if (ranker_ && clearing.size() > 1) {
    std::vector<std::string> candidates;
    for (const auto &le : clearing)
      if (clearing.front().edge - le.edge <= config_.venue_equivalence)
        candidates.push_back(le.line->line.venue);
    if (candidates.size() > 1) {
      auto ranked = ranker_->rankVenues(candidates);
      if (!ranked.empty()) {
        for (const auto &le : clearing) {
          if (le.line->line.venue == ranked.front()) {
            chosen = &le;
            break;
          }
        }
        spdlog::debug("[Detect] {} rotation: {} candidates → {}", pair.key(),
                      candidates.size(), ranked.front());
      }
    }
  }

  double size = maxSize(book, *chosen->line, exposure);
  if (size <= 0.0) {
    spdlog::debug("[Detect] {} edge {:.4f} but no size", pair.key(),
                  chosen->edge);
    return std::nullopt;
  }

  auto opp = buildPlan(pair, *chosen, book, size, now);
  spdlog::info("[Detect] {} edge={:.4f} size={:.0f} {}{}", opp.pair_key,
               opp.edge, opp.max_size, opp.description,
               opp.executable ? "" : " (alert only)");
  return opp;
}

} // namespace xarb
