#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ── Venues ───────────────────────────────────────────────────────────
enum class VenueKind { EXCHANGE, ODDS };

enum class FeeKind {
  NONE,
  PROPORTIONAL,        // rate * price per unit
  EXCHANGE_QUADRATIC,  // rate * p * (1 - p) per contract (Kalshi taker)
  WINNINGS_COMMISSION  // rate taken from net winnings
};

struct FeeModel {
  FeeKind kind = FeeKind::NONE;
  double rate = 0.0;
};

struct VenueConfig {
  std::string id;
  VenueKind kind = VenueKind::ODDS;
  FeeModel fees;
  double max_bet_usd = 50.0;
  double max_daily_volume_usd = 500.0;
  int confirm_latency_ms = 0;
  bool read_only = false;
};

// ── Configuration ────────────────────────────────────────────────────
struct RetryPolicy {
  int max_attempts = 3;
  int base_delay_ms = 200;
  int max_delay_ms = 5000;
  int max_rate_limit_waits = 5;
};

struct Config {
  bool live_mode = false; // paper by default
  int scan_interval_ms = 2000;
  int stale_ms = 2000;             // opportunity age bound
  int quote_freshness_ms = 15000;  // snapshot age bound

  // detection
  double min_edge = 0.01;
  double edge_noise = 0.005;
  double venue_equivalence = 0.002;
  double max_units = 100.0;

  // matching
  double match_threshold = 0.85;
  double name_weight = 0.6;
  double time_weight = 0.4;
  int time_tolerance_s = 3 * 3600;

  // execution
  int leg1_timeout_ms = 3000;
  int leg2_timeout_ms = 10000;
  int poll_interval_ms = 100;
  RetryPolicy retry;

  // risk
  double min_actionable_units = 1.0;
  double max_global_exposure_usd = 500.0;
  double max_daily_loss_usd = 50.0;
  double max_drawdown_usd = 100.0;
  int throttle_rejections = 3;
  int throttle_window_s = 600;
  double hard_max_leg_usd = 50.0; // config can never raise a bet cap above this

  // venues
  std::string exchange_venue = "kalshi";
  std::vector<VenueConfig> venues = {
      {"kalshi", VenueKind::EXCHANGE, {FeeKind::EXCHANGE_QUADRATIC, 0.07},
       50.0, 500.0, 1500, false}};
  std::vector<std::string> sports = {"basketball_nba", "icehockey_nhl",
                                     "americanfootball_nfl"};
  std::vector<std::string> regions = {"us"};
  std::string data_dir = "logs";

  // credentials (environment only)
  std::string kalshi_key_id;
  std::string kalshi_private_key_path;
  std::string odds_api_key;

  const VenueConfig *venue(const std::string &id) const {
    for (const auto &v : venues)
      if (v.id == id)
        return &v;
    return nullptr;
  }
};

// ── Prices ───────────────────────────────────────────────────────────
enum class Side { BUY, SELL };

// A = YES / home / over, B = NO / away / under
enum class OutcomeSide { A, B };

inline OutcomeSide opposite(OutcomeSide s) {
  return s == OutcomeSide::A ? OutcomeSide::B : OutcomeSide::A;
}

enum class PriceFormat { AMERICAN, PROBABILITY, DECIMAL };

// One venue's price for one side of one event. Never modified after
// construction; pass by const reference.
struct Quote {
  std::string venue;
  std::string instrument_id;
  OutcomeSide side = OutcomeSide::A;
  double price = 0.0;
  PriceFormat format = PriceFormat::PROBABILITY;
  Timestamp timestamp;
  double available_size = 0.0; // 0 = venue does not report size
};

struct NormalizedQuote {
  Quote quote;
  double implied = 0.0;
  double fee_adjusted = 0.0;
};

struct OrderBookLevel {
  double price;
  double size;
};

// YES-side book, prices in probability units
struct OrderBook {
  std::string ticker;
  std::vector<OrderBookLevel> bids;
  std::vector<OrderBookLevel> asks;
  Timestamp timestamp;

  double bestBid() const { return bids.empty() ? 0.0 : bids.front().price; }
  double bestAsk() const { return asks.empty() ? 1.0 : asks.front().price; }
  double bestAskSize() const { return asks.empty() ? 0.0 : asks.front().size; }
  double midpoint() const { return (bestBid() + bestAsk()) / 2.0; }
  double spread() const { return bestAsk() - bestBid(); }
};

// ── Market data ──────────────────────────────────────────────────────
enum class ContractType { BINARY_WINNER, SPREAD, TOTAL };
enum class MarketType { MONEYLINE, SPREADS, TOTALS };

// One exchange contract. YES pays 1 if `outcome` happens.
struct Instrument {
  std::string ticker;
  std::string event_ticker;
  std::string category; // sport key, e.g. "basketball_nba"
  std::vector<std::string> participants;
  std::string outcome;
  Timestamp start_time;
  ContractType type = ContractType::BINARY_WINNER;
  std::optional<double> point;
  double yes_bid = 0.0;
  double yes_ask = 0.0;
  double volume = 0.0;
};

// One two-way odds line. Side A is home (or Over), side B away (or Under).
struct OddsLine {
  std::string venue;
  std::string event_id;
  std::string category;
  std::string home;
  std::string away;
  Timestamp start_time;
  MarketType type = MarketType::MONEYLINE;
  std::optional<double> point; // side A's point
  std::string outcome_a;
  std::string outcome_b;
  Quote quote_a;
  Quote quote_b;

  std::string id() const;
  const Quote &quote(OutcomeSide s) const {
    return s == OutcomeSide::A ? quote_a : quote_b;
  }
  const std::string &outcome(OutcomeSide s) const {
    return s == OutcomeSide::A ? outcome_a : outcome_b;
  }
};

// ── Matching ─────────────────────────────────────────────────────────
struct MatchBasis {
  double name_score = 0.0;
  double time_score = 0.0;
  MarketType market_type = MarketType::MONEYLINE;
};

struct PairedLine {
  OddsLine line;
  OutcomeSide hedge_side = OutcomeSide::B; // complement of the contract
  MatchBasis basis;
  double confidence = 0.0;
};

struct MatchedPair {
  Instrument instrument;
  std::vector<PairedLine> lines; // at most one per venue
  double confidence = 0.0;       // best line

  const std::string &key() const { return instrument.ticker; }
};

// ── Opportunities ────────────────────────────────────────────────────
struct LegPlan {
  std::string venue;
  VenueKind kind = VenueKind::EXCHANGE;
  std::string instrument_id; // ticker or line id
  std::string event_id;
  OutcomeSide side = OutcomeSide::A;
  std::string outcome;
  double price = 0.0; // probability (exchange) or American odds (odds venue)
  PriceFormat format = PriceFormat::PROBABILITY;
  double size = 0.0; // units of $1 payout
};

struct Opportunity {
  std::string pair_key;
  std::string hedge_venue;
  double edge = 0.0;
  double max_size = 0.0;
  double exchange_cost = 0.0; // fee-adjusted, per unit
  double hedge_prob = 0.0;    // de-vigged, fee-adjusted
  Timestamp detected_at;
  std::vector<LegPlan> legs; // execution order
  bool executable = true;
  std::string description;

  const LegPlan *leg(VenueKind kind) const {
    for (const auto &l : legs)
      if (l.kind == kind)
        return &l;
    return nullptr;
  }
  double worstCaseLossUsd() const;
};

// ── Execution ────────────────────────────────────────────────────────
enum class LegState {
  PENDING,
  SUBMITTED,
  FILLED,
  PARTIALLY_FILLED,
  REJECTED,
  TIMED_OUT,
  CANCELLED
};

enum class AttemptState {
  PLANNED,
  LEG1_SUBMITTED,
  LEG1_FILLED,
  LEG1_PARTIAL_FILL,
  LEG1_REJECTED,
  LEG1_TIMED_OUT,
  LEG2_SUBMITTED,
  BOTH_FILLED,
  LEG2_PARTIAL_FILL,
  LEG2_REJECTED,
  LEG2_TIMED_OUT,
  ABANDONED,
  NAKED_EXPOSURE
};

inline bool isTerminal(AttemptState s) {
  return s == AttemptState::BOTH_FILLED ||
         s == AttemptState::LEG2_PARTIAL_FILL ||
         s == AttemptState::ABANDONED || s == AttemptState::NAKED_EXPOSURE;
}

struct LegRecord {
  LegPlan plan;
  LegState state = LegState::PENDING;
  std::string order_id;
  std::string client_order_id; // ours, stable across placement retries
  double requested_size = 0.0;
  double filled_size = 0.0;
  double avg_price = 0.0;
  std::string error;
  Timestamp submitted_at;
  Timestamp completed_at;
};

struct ExecutionAttempt {
  std::string id;
  Opportunity opportunity;
  AttemptState state = AttemptState::PLANNED;
  std::vector<AttemptState> history;
  LegRecord leg1;
  LegRecord leg2;
  double planned_edge = 0.0;
  double realized_edge = 0.0;
  double hedged_units = 0.0;
  double unhedged_units = 0.0;
  double realized_pnl = 0.0; // locked in on hedged units
  Timestamp started_at;
  Timestamp finished_at;

  bool terminal() const { return isTerminal(state); }
};

// ── Exposure ─────────────────────────────────────────────────────────
struct VenueExposure {
  std::string venue;
  double open_position_usd = 0.0;
  double reserved_usd = 0.0;
  double daily_volume_usd = 0.0;
  double daily_realized_pnl = 0.0;
  int leg2_rejections = 0;
  bool flagged = false;
  std::string flag_reason;
  Timestamp last_activity; // epoch = never traded
};

struct ExposureState {
  std::map<std::string, VenueExposure> venues;
  double daily_realized_pnl = 0.0;
  double cumulative_pnl = 0.0;
  double high_water_mark = 0.0;
  long day = 0; // UTC days since epoch

  double totalOpenUsd() const {
    double total = 0.0;
    for (const auto &[id, v] : venues)
      total += v.open_position_usd + v.reserved_usd;
    return total;
  }
};

struct Position {
  std::string id; // attempt id
  std::string pair_key;
  std::string exchange_venue;
  std::string hedge_venue;
  double hedged_units = 0.0;
  double unhedged_units = 0.0;
  double exchange_cost_usd = 0.0;
  double hedge_stake_usd = 0.0;
  std::string unhedged_venue; // leg holding the residual units
  double unhedged_cost_usd = 0.0;
  double locked_pnl = 0.0;
  bool hedged = true;
  bool open = true;
  Timestamp opened_at;
};

// ── Helpers ──────────────────────────────────────────────────────────
const char *toString(AttemptState s);
const char *toString(LegState s);
const char *toString(MarketType t);
const char *toString(ContractType t);

inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

inline double ageMs(Timestamp then, Timestamp now) {
  return std::chrono::duration<double, std::milli>(now - then).count();
}

inline long utcDay(Timestamp t) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::hours>(t.time_since_epoch())
          .count() /
      24);
}

std::string isoTimestamp(Timestamp t);
std::optional<Timestamp> parseIsoTimestamp(const std::string &s);

} // namespace xarb
