// ═══════════════════════════════════════════════════════════════════════
//  XARB — Unit Test Suite
//  Converter, matching, detection, book, config, journal and venue parsing
//  with synthetic data — no network calls
// ═══════════════════════════════════════════════════════════════════════
#include "harness.hpp"
#include "mock_venues.hpp"

#include "xarb/arb_detector.hpp"
#include "xarb/common.hpp"
#include "xarb/config.hpp"
#include "xarb/journal.hpp"
#include "xarb/kalshi_client.hpp"
#include "xarb/market_matcher.hpp"
#include "xarb/odds.hpp"
#include "xarb/odds_api_client.hpp"
#include "xarb/opportunity_book.hpp"
#include "xarb/paper_bookmaker.hpp"
#include "xarb/portfolio_manager.hpp"
#include "xarb/retry.hpp"
#include "xarb/risk_manager.hpp"
#include "xarb/team_aliases.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace xarb;
using namespace xarb::testing;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════
//  Fixtures
// ═══════════════════════════════════════════════════════════════════════
static const std::string kTicker = "KXNBAGAME-26FEB01OKCDEN-DEN";

static Timestamp gameTime() {
  return *parseIsoTimestamp("2026-02-02T03:00:00Z");
}

static OrderBook makeBook(double ask, double size, Timestamp ts) {
  OrderBook b;
  b.ticker = kTicker;
  b.bids = {{ask - 0.02, size}};
  b.asks = {{ask, size}};
  b.timestamp = ts;
  return b;
}

static MatchedPair pairFor(const Config &cfg, const std::vector<OddsLine> &lines) {
  MarketMatcher matcher(cfg);
  auto pairs = matcher.match({nbaInstrument(kTicker, gameTime())}, lines);
  if (pairs.empty())
    throw std::runtime_error("fixture did not match");
  return pairs.front();
}

static size_t countLines(const std::filesystem::path &p) {
  std::ifstream in(p);
  size_t n = 0;
  std::string line;
  while (std::getline(in, line))
    n++;
  return n;
}

// ═══════════════════════════════════════════════════════════════════════
int main() {
  spdlog::set_level(spdlog::level::off);

  std::cout << "\n╔══════════════════════════════════════════════╗\n";
  std::cout << "║        XARB — Unit Test Suite                ║\n";
  std::cout << "╚══════════════════════════════════════════════╝\n";

  // ─── 1. COMMON / DATA STRUCTURES ────────────────────────────────
  std::cout << "\n📦 common.hpp\n";

  runTest("orderbook_best_bid_ask", [] {
    OrderBook book;
    book.bids = {{0.55, 100}, {0.50, 200}};
    book.asks = {{0.60, 100}, {0.65, 200}};
    ASSERT_NEAR(book.bestBid(), 0.55, 1e-9);
    ASSERT_NEAR(book.bestAsk(), 0.60, 1e-9);
    ASSERT_NEAR(book.bestAskSize(), 100.0, 1e-9);
    ASSERT_NEAR(book.midpoint(), 0.575, 1e-9);
  });

  runTest("orderbook_empty", [] {
    OrderBook book;
    ASSERT_NEAR(book.bestBid(), 0.0, 1e-9);
    ASSERT_NEAR(book.bestAsk(), 1.0, 1e-9);
    ASSERT_NEAR(book.bestAskSize(), 0.0, 1e-9);
  });

  runTest("iso_timestamp_round_trip", [] {
    auto t = parseIsoTimestamp("2026-02-02T03:00:00Z");
    ASSERT_TRUE(t.has_value());
    ASSERT_EQ(isoTimestamp(*t), std::string("2026-02-02T03:00:00.000Z"));
    ASSERT_FALSE(parseIsoTimestamp("not a time").has_value());
  });

  runTest("odds_line_id", [] {
    auto l = nbaLine("draftkings", gameTime(), -150, 130);
    ASSERT_EQ(l.id(), std::string("draftkings:ev1:h2h"));
    l.type = MarketType::SPREADS;
    l.point = -4.5;
    ASSERT_EQ(l.id(), std::string("draftkings:ev1:spreads:-4.5"));
  });

  runTest("worst_case_loss_is_larger_leg", [] {
    auto opp = makeOpportunity("K", 10, 0.35, 122.0);
    // 10 * 0.35 = 3.50 on the exchange, 10 * 100/222 = 4.50 on the book
    ASSERT_NEAR(opp.worstCaseLossUsd(), 1000.0 / 222.0, 1e-9);
  });

  // ─── 2. FEE / ODDS CONVERTER ────────────────────────────────────
  std::cout << "\n🧮 odds.cpp\n";

  runTest("american_to_implied", [] {
    ASSERT_NEAR(odds::americanToImplied(-150), 0.6, 1e-12);
    ASSERT_NEAR(odds::americanToImplied(150), 0.4, 1e-12);
    ASSERT_NEAR(odds::americanToImplied(100), 0.5, 1e-12);
    ASSERT_NEAR(odds::americanToImplied(-100), 0.5, 1e-12);
  });

  runTest("american_out_of_range_throws", [] {
    ASSERT_THROWS(odds::americanToImplied(50), std::invalid_argument);
    ASSERT_THROWS(odds::americanToImplied(-99), std::invalid_argument);
  });

  runTest("american_round_trip", [] {
    for (double a : {-250.0, -110.0, 100.0, 122.0, 180.0, 650.0})
      ASSERT_NEAR(odds::impliedToAmerican(odds::americanToImplied(a)), a, 1e-9);
    ASSERT_EQ(odds::impliedToAmericanRounded(0.4), 150);
    ASSERT_EQ(odds::impliedToAmericanRounded(0.6), -150);
  });

  runTest("decimal_conversions", [] {
    ASSERT_NEAR(odds::americanToDecimal(150), 2.5, 1e-12);
    ASSERT_NEAR(odds::decimalToImplied(2.5), 0.4, 1e-12);
    ASSERT_NEAR(odds::impliedToDecimal(0.25), 4.0, 1e-12);
    ASSERT_THROWS(odds::decimalToImplied(1.0), std::invalid_argument);
    ASSERT_NEAR(odds::toImplied(0.37, PriceFormat::PROBABILITY), 0.37, 1e-12);
  });

  runTest("devig_proportional", [] {
    Eigen::VectorXd p(2);
    p << 0.55, 0.55;
    auto fair = odds::devigProportional(p);
    ASSERT_NEAR(fair[0], 0.5, 1e-12);
    ASSERT_NEAR(fair.sum(), 1.0, 1e-12);
  });

  runTest("devig_power_favors_favorite", [] {
    Eigen::VectorXd p(2);
    p << 0.6, 0.5;
    auto prop = odds::devigProportional(p);
    auto pow = odds::devigPower(p);
    ASSERT_NEAR(pow.sum(), 1.0, 1e-9);
    ASSERT_TRUE(pow[0] > prop[0]);
    ASSERT_TRUE(pow[1] < prop[1]);
  });

  runTest("fee_models", [] {
    FeeModel quad{FeeKind::EXCHANGE_QUADRATIC, 0.07};
    ASSERT_NEAR(odds::feePerUnit(0.5, quad), 0.0175, 1e-12);
    // rounded up to the cent in USD
    ASSERT_NEAR(odds::feeUsd(0.5, 10, quad), 0.18, 1e-12);

    FeeModel prop{FeeKind::PROPORTIONAL, 0.02};
    ASSERT_NEAR(odds::feePerUnit(0.4, prop), 0.008, 1e-12);

    FeeModel comm{FeeKind::WINNINGS_COMMISSION, 0.05};
    ASSERT_NEAR(odds::feePerUnit(0.4, comm), 0.03, 1e-12);

    ASSERT_NEAR(odds::feePerUnit(0.4, FeeModel{}), 0.0, 1e-12);
  });

  runTest("fees_move_against_us", [] {
    FeeModel quad{FeeKind::EXCHANGE_QUADRATIC, 0.07};
    ASSERT_TRUE(odds::feeAdjustedCost(0.4, quad) > 0.4);
    ASSERT_TRUE(odds::feeAdjustedImplied(0.4, quad) < 0.4);
  });

  runTest("normalize_quote", [] {
    Quote q;
    q.price = 150;
    q.format = PriceFormat::AMERICAN;
    auto nq = odds::normalize(q, FeeModel{FeeKind::PROPORTIONAL, 0.1});
    ASSERT_NEAR(nq.implied, 0.4, 1e-12);
    ASSERT_NEAR(nq.fee_adjusted, 0.36, 1e-12);
  });

  runTest("leg_outlay_uses_fill_price", [] {
    LegRecord leg;
    leg.plan = exchangeLeg("K", 0.40, 10);
    leg.filled_size = 8;
    leg.avg_price = 0.41;
    ASSERT_NEAR(odds::legOutlayUsd(leg, FeeModel{}), 3.28, 1e-9);
    leg.filled_size = 0;
    ASSERT_NEAR(odds::legOutlayUsd(leg, FeeModel{}), 0.0, 1e-12);

    LegRecord bet;
    bet.plan = oddsLeg("draftkings", "x", 150, 10);
    bet.filled_size = 10;
    ASSERT_NEAR(odds::legOutlayUsd(bet, FeeModel{}), 4.0, 1e-9);
  });

  // ─── 3. MARKET MATCHER ──────────────────────────────────────────
  std::cout << "\n🔗 market_matcher.cpp\n";

  runTest("aliases_resolve_short_names", [] {
    const auto &a = TeamAliases::instance();
    auto okc = a.resolve("OKC", "basketball_nba");
    ASSERT_TRUE(okc.has_value());
    ASSERT_EQ(*okc, *a.resolve("Oklahoma City", "basketball_nba"));
    ASSERT_EQ(*okc, *a.resolve("Oklahoma City Thunder", "basketball_nba"));
    ASSERT_NEAR(MarketMatcher::nameSimilarity("OKC", "Oklahoma City Thunder",
                                              "basketball_nba"),
                1.0, 1e-12);
  });

  runTest("aliases_shared_city_per_sport", [] {
    const auto &a = TeamAliases::instance();
    ASSERT_EQ(*a.resolve("Denver", "basketball_nba"), std::string("denver nuggets"));
    ASSERT_EQ(*a.resolve("Denver", "americanfootball_nfl"),
              std::string("denver broncos"));
  });

  runTest("confidence_monotone", [] {
    MarketMatcher m(testConfig());
    ASSERT_TRUE(m.confidence(0.95, 0.5) > m.confidence(0.9, 0.5));
    ASSERT_TRUE(m.confidence(0.9, 0.6) > m.confidence(0.9, 0.5));
    ASSERT_NEAR(m.confidence(1.0, 1.0), 1.0, 1e-12);
  });

  runTest("time_proximity", [] {
    MarketMatcher m(testConfig());
    auto t = gameTime();
    ASSERT_NEAR(m.timeProximity(t, t), 1.0, 1e-12);
    ASSERT_NEAR(m.timeProximity(t, t + std::chrono::minutes(90)), 0.5, 1e-9);
    ASSERT_NEAR(m.timeProximity(t, t + std::chrono::hours(4)), 0.0, 1e-12);
  });

  runTest("token_overlap_counts_distinct_words", [] {
    ASSERT_NEAR(MarketMatcher::jaccardSimilarity({"denver", "nuggets", "nuggets"},
                                                 {"nuggets", "denver"}),
                1.0, 1e-12);
    ASSERT_NEAR(MarketMatcher::jaccardSimilarity({"oklahoma", "city", "thunder"},
                                                 {"city", "thunder", "okc"}),
                0.5, 1e-12);
    ASSERT_NEAR(MarketMatcher::jaccardSimilarity({}, {}), 0.0, 1e-12);
    ASSERT_NEAR(MarketMatcher::jaccardSimilarity({"denver"}, {}), 0.0, 1e-12);
  });

  runTest("match_moneyline_hedges_opposite_side", [] {
    auto cfg = testConfig();
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(), -150, 130)});
    ASSERT_EQ(pair.key(), kTicker);
    ASSERT_EQ(pair.lines.size(), 1u);
    // Denver YES on the exchange, Denver is home (A), so hedge the away side
    ASSERT_TRUE(pair.lines[0].hedge_side == OutcomeSide::B);
    ASSERT_NEAR(pair.confidence, 1.0, 1e-9);
  });

  runTest("match_away_contract", [] {
    auto cfg = testConfig();
    auto inst = nbaInstrument("KXNBAGAME-26FEB01OKCDEN-OKC", gameTime());
    inst.outcome = "Oklahoma City";
    MarketMatcher m(cfg);
    auto p = m.score(inst, nbaLine("draftkings", gameTime(), -150, 130));
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(p->hedge_side == OutcomeSide::A);
  });

  runTest("type_gate_rejects_incompatible", [] {
    auto cfg = testConfig();
    MarketMatcher m(cfg);
    auto line = nbaLine("draftkings", gameTime(), -110, -110);
    line.type = MarketType::SPREADS;
    line.point = -3.5;
    ASSERT_FALSE(m.score(nbaInstrument(kTicker, gameTime()), line).has_value());
    ASSERT_FALSE(MarketMatcher::compatible(ContractType::BINARY_WINNER,
                                           MarketType::TOTALS));
    ASSERT_TRUE(MarketMatcher::compatible(ContractType::TOTAL, MarketType::TOTALS));
  });

  runTest("below_threshold_dropped", [] {
    auto cfg = testConfig();
    MarketMatcher m(cfg);
    // 2.5h apart: time score 1/6, confidence 0.6 + 0.4/6 < 0.85
    auto line = nbaLine("draftkings", gameTime() + std::chrono::minutes(150),
                        -150, 130);
    auto pairs = m.match({nbaInstrument(kTicker, gameTime())}, {line});
    ASSERT_TRUE(pairs.empty());
  });

  runTest("category_filter", [] {
    auto cfg = testConfig();
    MarketMatcher m(cfg);
    auto line = nbaLine("draftkings", gameTime(), -150, 130);
    line.category = "icehockey_nhl";
    ASSERT_TRUE(m.match({nbaInstrument(kTicker, gameTime())}, {line}).empty());
  });

  runTest("no_candidates_no_pairs", [] {
    MarketMatcher m(testConfig());
    ASSERT_TRUE(m.match({nbaInstrument(kTicker, gameTime())}, {}).empty());
    ASSERT_TRUE(m.match({}, {nbaLine("draftkings", gameTime(), -150, 130)}).empty());
  });

  runTest("one_line_per_venue_closest_time_wins", [] {
    auto cfg = testConfig();
    auto exact = nbaLine("draftkings", gameTime(), -150, 130);
    auto late = nbaLine("draftkings", gameTime() + std::chrono::minutes(20),
                        -150, 130);
    late.event_id = "ev2";
    auto other = nbaLine("fanduel", gameTime(), -145, 125);
    auto pair = pairFor(cfg, {late, exact, other});
    ASSERT_EQ(pair.lines.size(), 2u);
    for (const auto &l : pair.lines)
      if (l.line.venue == "draftkings")
        ASSERT_EQ(l.line.event_id, std::string("ev1"));
  });

  runTest("participant_order_irrelevant", [] {
    auto cfg = testConfig();
    auto inst = nbaInstrument(kTicker, gameTime());
    inst.participants = {"Oklahoma City", "Denver"};
    MarketMatcher m(cfg);
    auto p = m.score(inst, nbaLine("draftkings", gameTime(), -150, 130));
    ASSERT_TRUE(p.has_value());
    ASSERT_NEAR(p->basis.name_score, 1.0, 1e-9);
  });

  runTest("spread_sign_must_agree", [] {
    auto cfg = testConfig();
    MarketMatcher m(cfg);
    auto inst = nbaInstrument(kTicker, gameTime());
    inst.type = ContractType::SPREAD;
    inst.point = -4.5; // Denver -4.5
    auto line = nbaLine("draftkings", gameTime(), -110, -110);
    line.type = MarketType::SPREADS;
    line.point = -4.5; // home Denver -4.5
    auto ok = m.score(inst, line);
    ASSERT_TRUE(ok.has_value());
    ASSERT_TRUE(ok->hedge_side == OutcomeSide::B);

    line.point = 4.5; // Denver +4.5 is a different proposition
    ASSERT_FALSE(m.score(inst, line).has_value());
  });

  runTest("totals_over_under", [] {
    auto cfg = testConfig();
    MarketMatcher m(cfg);
    auto inst = nbaInstrument(kTicker, gameTime());
    inst.type = ContractType::TOTAL;
    inst.outcome = "Over 221.5";
    inst.point = 221.5;
    auto line = nbaLine("draftkings", gameTime(), -110, -110);
    line.type = MarketType::TOTALS;
    line.point = 221.5;
    line.outcome_a = "Over";
    line.outcome_b = "Under";
    auto p = m.score(inst, line);
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(p->hedge_side == OutcomeSide::B);

    line.point = 220.5;
    ASSERT_FALSE(m.score(inst, line).has_value());
  });

  // ─── 4. ARBITRAGE DETECTION ─────────────────────────────────────
  std::cout << "\n🎯 arb_detector.cpp\n";

  runTest("fair_line_at_ask_no_trade", [] {
    // ask 0.40, complement at +150 (0.40) in a vig-free two-way market
    auto cfg = testConfig();
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(), -150, 150)});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto book = makeBook(0.40, 100, now);
    auto le = det.lineEdge(pair.lines[0], book);
    ASSERT_TRUE(le.has_value());
    ASSERT_NEAR(le->edge, 0.0, 1e-9);
    ASSERT_FALSE(det.evaluate(pair, book, ExposureState{}, now).has_value());
  });

  runTest("edge_over_threshold_emits_exchange_first", [] {
    auto cfg = testConfig();
    cfg.min_edge = 0.05;
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(),
                                      odds::impliedToAmerican(0.55),
                                      odds::impliedToAmerican(0.45))});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto opp = det.evaluate(pair, makeBook(0.35, 50, now), ExposureState{}, now);
    ASSERT_TRUE(opp.has_value());
    ASSERT_NEAR(opp->edge, 0.10, 1e-9);
    ASSERT_EQ(opp->legs.size(), 2u);
    ASSERT_TRUE(opp->legs[0].kind == VenueKind::EXCHANGE);
    ASSERT_NEAR(opp->legs[0].price, 0.35, 1e-12);
    ASSERT_TRUE(opp->legs[1].side == OutcomeSide::B);
    ASSERT_EQ(opp->hedge_venue, std::string("draftkings"));
    ASSERT_NEAR(opp->max_size, 50.0, 1e-9);
    ASSERT_TRUE(opp->executable);
  });

  runTest("exchange_fee_shrinks_edge", [] {
    auto cfg = testConfig();
    cfg.venues[0].fees = {FeeKind::EXCHANGE_QUADRATIC, 0.07};
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(),
                                      odds::impliedToAmerican(0.55),
                                      odds::impliedToAmerican(0.45))});
    ArbDetector det(cfg);
    auto le = det.lineEdge(pair.lines[0], makeBook(0.35, 50, Clock::now()));
    ASSERT_TRUE(le.has_value());
    ASSERT_NEAR(le->exchange_cost, 0.35 + 0.07 * 0.35 * 0.65, 1e-12);
    ASSERT_NEAR(le->edge, 0.45 - le->exchange_cost, 1e-9);
  });

  runTest("size_bounded_by_liquidity", [] {
    auto cfg = testConfig();
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(),
                                      odds::impliedToAmerican(0.55),
                                      odds::impliedToAmerican(0.45))});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto opp = det.evaluate(pair, makeBook(0.35, 7, now), ExposureState{}, now);
    ASSERT_TRUE(opp.has_value());
    ASSERT_NEAR(opp->max_size, 7.0, 1e-9);
  });

  runTest("size_bounded_by_caps", [] {
    auto cfg = testConfig();
    cfg.venues[0].max_bet_usd = 5.0;
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(),
                                      odds::impliedToAmerican(0.55),
                                      odds::impliedToAmerican(0.45))});
    ArbDetector det(cfg);
    auto book = makeBook(0.35, 100, Clock::now());
    // $5 / 0.35 = 14.3 contracts
    ASSERT_NEAR(det.maxSize(book, pair.lines[0], ExposureState{}), 14.0, 1e-9);

    ExposureState used;
    used.venues["draftkings"].daily_volume_usd = 496.0; // $4 left at 0.45
    cfg.venues[0].max_bet_usd = 50.0;
    ArbDetector det2(cfg);
    ASSERT_NEAR(det2.maxSize(book, pair.lines[0], used), 8.0, 1e-9);
  });

  runTest("stale_book_throws", [] {
    auto cfg = testConfig();
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(), -150, 150)});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto book = makeBook(0.35, 50, now - std::chrono::seconds(20));
    ASSERT_THROWS(det.evaluate(pair, book, ExposureState{}, now), StaleData);
  });

  runTest("stale_line_throws", [] {
    auto cfg = testConfig();
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(), -150, 150)});
    pair.lines[0].line.quote_b.timestamp = Clock::now() - std::chrono::seconds(60);
    ArbDetector det(cfg);
    auto now = Clock::now();
    ASSERT_THROWS(det.evaluate(pair, makeBook(0.35, 50, now), ExposureState{}, now),
                  StaleData);
  });

  runTest("thinner_odds_leg_goes_first", [] {
    auto cfg = testConfig();
    auto line = nbaLine("draftkings", gameTime(), odds::impliedToAmerican(0.55),
                        odds::impliedToAmerican(0.45));
    line.quote_b.available_size = 5;
    auto pair = pairFor(cfg, {line});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto opp = det.evaluate(pair, makeBook(0.35, 50, now), ExposureState{}, now);
    ASSERT_TRUE(opp.has_value());
    ASSERT_TRUE(opp->legs[0].kind == VenueKind::ODDS);
    ASSERT_NEAR(opp->max_size, 5.0, 1e-9);
  });

  runTest("read_only_venue_is_alert_only", [] {
    auto cfg = testConfig();
    VenueRegistry venues;
    venues.addOddsVenue(std::make_shared<MockOddsVenue>("draftkings", false));
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(),
                                      odds::impliedToAmerican(0.55),
                                      odds::impliedToAmerican(0.45))});
    ArbDetector det(cfg, nullptr, &venues);
    auto now = Clock::now();
    auto opp = det.evaluate(pair, makeBook(0.35, 50, now), ExposureState{}, now);
    ASSERT_TRUE(opp.has_value());
    ASSERT_FALSE(opp->executable);
  });

  runTest("rotation_prefers_headroom", [] {
    auto cfg = testConfig();
    PortfolioManager portfolio(cfg);
    RiskManager risk(cfg, portfolio);
    // Hold $45 of DraftKings volume so FanDuel has more headroom
    auto held = makeOpportunity("OTHER", 100, 0.35, 122.0, "draftkings");
    ASSERT_FALSE(portfolio
                     .reserveIf(held, [](const ExposureState &) {
                       return std::optional<std::string>();
                     })
                     .has_value());

    double home = odds::impliedToAmerican(0.55);
    double away = odds::impliedToAmerican(0.45);
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(), home, away),
                              nbaLine("fanduel", gameTime(), home, away)});
    ArbDetector det(cfg, &risk);
    auto now = Clock::now();
    auto opp = det.evaluate(pair, makeBook(0.35, 20, now), portfolio.snapshot(),
                            now);
    ASSERT_TRUE(opp.has_value());
    ASSERT_EQ(opp->hedge_venue, std::string("fanduel"));
  });

  runTest("best_edge_wins_outside_equivalence", [] {
    auto cfg = testConfig();
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(),
                                      odds::impliedToAmerican(0.55),
                                      odds::impliedToAmerican(0.45)),
                              nbaLine("fanduel", gameTime(),
                                      odds::impliedToAmerican(0.52),
                                      odds::impliedToAmerican(0.48))});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto opp = det.evaluate(pair, makeBook(0.35, 20, now), ExposureState{}, now);
    ASSERT_TRUE(opp.has_value());
    ASSERT_EQ(opp->hedge_venue, std::string("fanduel"));
    ASSERT_NEAR(opp->edge, 0.13, 1e-9);
  });

  runTest("locked_loss_pair_not_emitted", [] {
    // Denver +400 / OKC -400: buying Denver at 0.35 and OKC at 0.80 costs
    // 1.15 per unit for a payout of 1
    auto cfg = testConfig();
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(), 400, -400)});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto book = makeBook(0.35, 50, now);
    auto le = det.lineEdge(pair.lines[0], book);
    ASSERT_TRUE(le.has_value());
    ASSERT_NEAR(le->edge, 0.45, 1e-9);
    ASSERT_NEAR(le->locked_margin, -0.15, 1e-9);
    ASSERT_FALSE(det.evaluate(pair, book, ExposureState{}, now).has_value());
  });

  runTest("vig_eats_locked_margin", [] {
    // De-vigged hedge clears the ask, but the vigged price actually paid
    // leaves nothing locked in
    auto cfg = testConfig();
    cfg.min_edge = 0.01;
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(), 100,
                                      odds::impliedToAmerican(0.55))});
    ArbDetector det(cfg);
    auto now = Clock::now();
    auto book = makeBook(0.50, 50, now);
    auto le = det.lineEdge(pair.lines[0], book);
    ASSERT_TRUE(le.has_value());
    ASSERT_TRUE(le->edge >= cfg.min_edge);
    ASSERT_NEAR(le->locked_margin, 1.0 - 0.50 - 0.55, 1e-6);
    ASSERT_FALSE(det.evaluate(pair, book, ExposureState{}, now).has_value());
  });

  runTest("emitted_pair_locks_min_edge", [] {
    auto cfg = testConfig();
    cfg.min_edge = 0.05;
    auto pair = pairFor(cfg, {nbaLine("draftkings", gameTime(),
                                      odds::impliedToAmerican(0.55),
                                      odds::impliedToAmerican(0.45))});
    ArbDetector det(cfg);
    auto le = det.lineEdge(pair.lines[0], makeBook(0.35, 50, Clock::now()));
    ASSERT_TRUE(le.has_value());
    ASSERT_NEAR(le->locked_margin, 0.20, 1e-6);
  });

  // ─── 5. OPPORTUNITY BOOK ────────────────────────────────────────
  std::cout << "\n📚 opportunity_book.cpp\n";

  runTest("book_emits_new_and_changed", [] {
    OpportunityBook book(0.005, 2000);
    auto a = makeOpportunity("A", 10);
    auto b = makeOpportunity("B", 10);
    ASSERT_EQ(book.replace({a, b}).size(), 2u);

    a.edge += 0.003; // noise
    b.edge += 0.02;  // real move
    auto emitted = book.replace({a, b});
    ASSERT_EQ(emitted.size(), 1u);
    ASSERT_EQ(emitted[0].pair_key, std::string("B"));
  });

  runTest("book_replaced_wholesale", [] {
    OpportunityBook book(0.005, 2000);
    book.replace({makeOpportunity("A", 10), makeOpportunity("B", 10)});
    book.replace({makeOpportunity("B", 10)});
    ASSERT_EQ(book.size(), 1u);
    ASSERT_FALSE(book.take("A", Clock::now()).has_value());
  });

  runTest("book_take_once", [] {
    OpportunityBook book(0.005, 2000);
    book.replace({makeOpportunity("A", 10)});
    ASSERT_TRUE(book.take("A", Clock::now()).has_value());
    ASSERT_FALSE(book.take("A", Clock::now()).has_value());
    ASSERT_TRUE(book.current().empty());

    // re-observed within noise: still consumed
    book.replace({makeOpportunity("A", 10)});
    ASSERT_FALSE(book.take("A", Clock::now()).has_value());
  });

  runTest("book_refresh_carries_current_size", [] {
    OpportunityBook book(0.005, 2000);
    book.replace({makeOpportunity("A", 10, 0.35)});

    // liquidity shrank and the ask ticked up; edge moved only 0.003
    auto thinner = makeOpportunity("A", 2, 0.353);
    thinner.edge = 0.097;
    ASSERT_TRUE(book.replace({thinner}).empty());

    auto taken = book.take("A", Clock::now());
    ASSERT_TRUE(taken.has_value());
    ASSERT_NEAR(taken->max_size, 2.0, 1e-12);
    ASSERT_NEAR(taken->legs[0].size, 2.0, 1e-12);
    ASSERT_NEAR(taken->legs[0].price, 0.353, 1e-12);
    ASSERT_NEAR(taken->edge, 0.097, 1e-12);
  });

  runTest("book_drift_beyond_noise_re_emits", [] {
    OpportunityBook book(0.005, 2000);
    auto a = makeOpportunity("A", 10);
    book.replace({a});
    // each step inside the noise, the sum outside it
    a.edge = 0.104;
    ASSERT_TRUE(book.replace({a}).empty());
    a.edge = 0.108;
    ASSERT_EQ(book.replace({a}).size(), 1u);
  });

  runTest("book_stale_entry_discarded", [] {
    OpportunityBook book(0.005, 100);
    auto a = makeOpportunity("A", 10);
    a.detected_at = Clock::now() - std::chrono::seconds(1);
    book.replace({a});
    ASSERT_FALSE(book.take("A", Clock::now()).has_value());
    ASSERT_EQ(book.size(), 0u);
  });

  // ─── 6. CONFIG ──────────────────────────────────────────────────
  std::cout << "\n⚙️  config.cpp\n";

  runTest("defaults_validate", [] {
    Config cfg;
    validateConfig(cfg);
    ASSERT_NEAR(cfg.min_edge, 0.01, 1e-12);
    ASSERT_FALSE(cfg.live_mode);
    ASSERT_TRUE(cfg.venue("kalshi") != nullptr);
  });

  runTest("parse_overrides", [] {
    auto cfg = parseConfig(R"({
      "min_edge": 0.03,
      "leg2_timeout_ms": 4000,
      "retry": {"max_attempts": 5},
      "venues": [
        {"id": "kalshi", "kind": "exchange"},
        {"id": "fanduel", "max_bet_usd": 25, "fee_model": "proportional",
         "fee_rate": 0.01}
      ],
      "sports": ["icehockey_nhl"],
      "unknown_key": true
    })");
    ASSERT_NEAR(cfg.min_edge, 0.03, 1e-12);
    ASSERT_EQ(cfg.leg2_timeout_ms, 4000);
    ASSERT_EQ(cfg.retry.max_attempts, 5);
    ASSERT_EQ(cfg.venues.size(), 2u);
    const auto *fd = cfg.venue("fanduel");
    ASSERT_TRUE(fd != nullptr);
    ASSERT_TRUE(fd->kind == VenueKind::ODDS);
    ASSERT_TRUE(fd->fees.kind == FeeKind::PROPORTIONAL);
    ASSERT_NEAR(fd->max_bet_usd, 25.0, 1e-12);
    ASSERT_TRUE(cfg.venue("kalshi")->fees.kind == FeeKind::EXCHANGE_QUADRATIC);
    ASSERT_EQ(cfg.sports.size(), 1u);
    validateConfig(cfg);
  });

  runTest("malformed_config_rejected", [] {
    ASSERT_THROWS(parseConfig("{not json"), ConfigurationError);
    ASSERT_THROWS(parseConfig("[1, 2]"), ConfigurationError);
    ASSERT_THROWS(parseConfig(R"({"min_edge": "high"})"), ConfigurationError);
    ASSERT_THROWS(parseConfig(R"({"venues": [{"id": "x", "fee_model": "??"}]})"),
                  ConfigurationError);
    ASSERT_THROWS(loadConfig("/nonexistent/xarb.json"), ConfigurationError);
  });

  runTest("invalid_thresholds_rejected", [] {
    Config cfg;
    cfg.min_edge = 1.5;
    ASSERT_THROWS(validateConfig(cfg), ConfigurationError);

    Config weights;
    weights.name_weight = 0.7; // + 0.4 != 1
    ASSERT_THROWS(validateConfig(weights), ConfigurationError);

    Config no_exchange;
    no_exchange.exchange_venue = "nadex";
    ASSERT_THROWS(validateConfig(no_exchange), ConfigurationError);

    Config daily;
    daily.venues[0].max_daily_volume_usd = 10.0; // below per-bet cap
    ASSERT_THROWS(validateConfig(daily), ConfigurationError);
  });

  runTest("bet_cap_clamped_to_hard_max", [] {
    Config cfg;
    cfg.venues[0].max_bet_usd = 80.0;
    validateConfig(cfg);
    ASSERT_NEAR(cfg.venues[0].max_bet_usd, cfg.hard_max_leg_usd, 1e-12);
  });

  runTest("state_presets", [] {
    auto ny = bookmakersForState("NY");
    ASSERT_FALSE(ny.empty());
    ASSERT_TRUE(std::find(ny.begin(), ny.end(), "fanduel") != ny.end());
    ASSERT_TRUE(bookmakersForState("zz").empty());
    auto v = defaultOddsVenue("betmgm");
    ASSERT_TRUE(v.kind == VenueKind::ODDS);
    ASSERT_EQ(v.id, std::string("betmgm"));
  });

  // ─── 7. JOURNAL ─────────────────────────────────────────────────
  std::cout << "\n📝 journal.cpp\n";

  runTest("journal_creates_files_with_headers", [] {
    auto dir = std::filesystem::temp_directory_path() / "xarb_journal_headers";
    std::filesystem::remove_all(dir);
    {
      CsvJournal journal(dir.string());
    }
    for (const char *f : {"scans.csv", "opportunities.csv", "attempts.csv"}) {
      ASSERT_TRUE(std::filesystem::exists(dir / f));
      ASSERT_EQ(countLines(dir / f), 1u);
    }
    std::filesystem::remove_all(dir);
  });

  runTest("journal_appends_without_repeating_header", [] {
    auto dir = std::filesystem::temp_directory_path() / "xarb_journal_append";
    std::filesystem::remove_all(dir);
    ScanRecord rec;
    rec.cycle = 1;
    rec.at = Clock::now();
    {
      CsvJournal journal(dir.string());
      journal.recordScan(rec);
    }
    {
      CsvJournal journal(dir.string());
      rec.cycle = 2;
      journal.recordScan(rec);
    }
    ASSERT_EQ(countLines(dir / "scans.csv"), 3u);
    std::filesystem::remove_all(dir);
  });

  runTest("journal_quotes_commas", [] {
    auto dir = std::filesystem::temp_directory_path() / "xarb_journal_quote";
    std::filesystem::remove_all(dir);
    auto opp = makeOpportunity("A", 10);
    opp.description = "BUY a, b";
    {
      CsvJournal journal(dir.string());
      journal.recordOpportunity(opp);
    }
    std::ifstream in(dir / "opportunities.csv");
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);
    ASSERT_TRUE(row.find("\"BUY a, b\"") != std::string::npos);
    std::filesystem::remove_all(dir);
  });

  runTest("journal_records_attempt", [] {
    auto dir = std::filesystem::temp_directory_path() / "xarb_journal_attempt";
    std::filesystem::remove_all(dir);
    ExecutionAttempt a;
    a.id = "A#1";
    a.opportunity = makeOpportunity("A", 10);
    a.state = AttemptState::BOTH_FILLED;
    a.leg1.plan = a.opportunity.legs[0];
    a.leg2.plan = a.opportunity.legs[1];
    {
      CsvJournal journal(dir.string());
      journal.recordAttempt(a);
    }
    std::ifstream in(dir / "attempts.csv");
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);
    ASSERT_TRUE(row.find("A#1") != std::string::npos);
    ASSERT_TRUE(row.find("BOTH_FILLED") != std::string::npos);
    std::filesystem::remove_all(dir);
  });

  // ─── 8. VENUE ADAPTERS (parsing only) ───────────────────────────
  std::cout << "\n🌐 kalshi_client.cpp / odds_api_client.cpp\n";

  runTest("kalshi_series_mapping", [] {
    ASSERT_EQ(KalshiClient::seriesForSport("basketball_nba"),
              std::string("KXNBAGAME"));
    ASSERT_EQ(KalshiClient::sportForSeries("KXNFLGAME"),
              std::string("americanfootball_nfl"));
    ASSERT_TRUE(KalshiClient::seriesForSport("soccer_epl").empty());
  });

  runTest("kalshi_parse_market", [] {
    json m = {{"ticker", kTicker},
              {"event_ticker", "KXNBAGAME-26FEB01OKCDEN"},
              {"title", "Oklahoma City at Denver Winner?"},
              {"expected_expiration_time", "2026-02-02T05:30:00Z"},
              {"yes_bid", 40},
              {"yes_ask", 42},
              {"volume", 1200}};
    auto inst = KalshiClient::parseMarket(m, "KXNBAGAME");
    ASSERT_TRUE(inst.has_value());
    ASSERT_EQ(inst->category, std::string("basketball_nba"));
    ASSERT_EQ(inst->outcome, std::string("Denver"));
    ASSERT_EQ(inst->participants.size(), 2u);
    ASSERT_EQ(inst->participants[0], std::string("Denver"));
    ASSERT_NEAR(inst->yes_ask, 0.42, 1e-12);
    // tip-off estimated from expiration minus game length
    ASSERT_TRUE(inst->start_time == gameTime());
  });

  runTest("kalshi_parse_market_rejects_unreadable", [] {
    json m = {{"ticker", kTicker},
              {"title", "Will it rain?"},
              {"expected_expiration_time", "2026-02-02T05:30:00Z"}};
    ASSERT_FALSE(KalshiClient::parseMarket(m, "KXNBAGAME").has_value());
    m["title"] = "Oklahoma City at Denver Winner?";
    m["ticker"] = "NODASH";
    ASSERT_FALSE(KalshiClient::parseMarket(m, "KXNBAGAME").has_value());
  });

  runTest("kalshi_orderbook_asks_from_no_bids", [] {
    json j = {{"orderbook",
               {{"yes", {{40, 100}, {38, 50}}}, {"no", {{55, 20}, {57, 30}}}}}};
    auto now = Clock::now();
    auto book = KalshiClient::parseOrderBook(j, kTicker, now);
    ASSERT_NEAR(book.bestBid(), 0.40, 1e-9);
    ASSERT_NEAR(book.bestAsk(), 0.43, 1e-9);
    ASSERT_NEAR(book.bestAskSize(), 30.0, 1e-9);
    ASSERT_EQ(book.asks.size(), 2u);
    ASSERT_TRUE(book.timestamp == now);

    auto empty = KalshiClient::parseOrderBook(json::object(), kTicker, now);
    ASSERT_TRUE(empty.asks.empty());
  });

  runTest("kalshi_parse_order", [] {
    auto filled = KalshiClient::parseOrder(
        {{"status", "executed"}, {"fill_count", 10}, {"taker_fill_cost", 420}});
    ASSERT_TRUE(filled.state == LegState::FILLED);
    ASSERT_NEAR(filled.filled_size, 10.0, 1e-12);
    ASSERT_NEAR(filled.avg_price, 0.42, 1e-12);

    auto resting = KalshiClient::parseOrder({{"status", "resting"},
                                             {"initial_count", 10},
                                             {"remaining_count", 4},
                                             {"yes_price", 35}});
    ASSERT_TRUE(resting.state == LegState::SUBMITTED);
    ASSERT_NEAR(resting.filled_size, 6.0, 1e-12);
    ASSERT_NEAR(resting.avg_price, 0.35, 1e-12);

    auto canceled = KalshiClient::parseOrder({{"status", "canceled"}});
    ASSERT_TRUE(canceled.state == LegState::CANCELLED);
  });

  runTest("kalshi_paper_orders_fill", [] {
    Config cfg;
    KalshiClient client(cfg);
    ASSERT_TRUE(client.paper());
    auto h = client.placeOrder(kTicker, Side::BUY, 0.35, 10.7, "c1");
    auto st = client.getOrderStatus(h);
    ASSERT_TRUE(st.state == LegState::FILLED);
    ASSERT_NEAR(st.filled_size, 10.0, 1e-12);
    ASSERT_NEAR(st.avg_price, 0.35, 1e-12);
    ASSERT_THROWS(client.placeOrder(kTicker, Side::BUY, 0.35, 0.5, "c2"),
                  RejectedOrder);
  });

  runTest("kalshi_paper_order_idempotent_by_client_id", [] {
    Config cfg;
    KalshiClient client(cfg);
    ASSERT_FALSE(client.findOrder(kTicker, "xarb-1-L1").has_value());
    auto first = client.placeOrder(kTicker, Side::BUY, 0.35, 10, "xarb-1-L1");
    auto again = client.placeOrder(kTicker, Side::BUY, 0.35, 10, "xarb-1-L1");
    ASSERT_EQ(again.order_id, first.order_id);
    auto found = client.findOrder(kTicker, "xarb-1-L1");
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->order_id, first.order_id);

    auto other = client.placeOrder(kTicker, Side::BUY, 0.35, 10, "xarb-1-L2");
    ASSERT_TRUE(other.order_id != first.order_id);
  });

  runTest("kalshi_order_id_for_client", [] {
    json list = json::parse(R"({"orders": [
      {"order_id": "o-1", "client_order_id": "xarb-9-A#1-L1"},
      {"order_id": "o-2", "client_order_id": "xarb-9-A#2-L1"}]})");
    auto hit = KalshiClient::orderIdForClient(list, "xarb-9-A#2-L1");
    ASSERT_TRUE(hit.has_value());
    ASSERT_EQ(*hit, std::string("o-2"));
    ASSERT_FALSE(KalshiClient::orderIdForClient(list, "xarb-9-A#3-L1").has_value());
    ASSERT_FALSE(KalshiClient::orderIdForClient(list, "").has_value());
    ASSERT_FALSE(KalshiClient::orderIdForClient(json::object(), "x").has_value());
  });

  runTest("kalshi_live_without_key_rejected", [] {
    Config cfg;
    cfg.live_mode = true;
    ASSERT_THROWS(KalshiClient client(cfg), ConfigurationError);
  });

  runTest("odds_api_parse_events", [] {
    json events = json::parse(R"([
      {"id": "ev1", "sport_key": "basketball_nba",
       "commence_time": "2026-02-02T03:00:00Z",
       "home_team": "Denver Nuggets", "away_team": "Oklahoma City Thunder",
       "bookmakers": [
         {"key": "draftkings", "markets": [
           {"key": "h2h", "outcomes": [
             {"name": "Oklahoma City Thunder", "price": 130},
             {"name": "Denver Nuggets", "price": -150}]},
           {"key": "spreads", "outcomes": [
             {"name": "Denver Nuggets", "price": -110, "point": -3.5},
             {"name": "Oklahoma City Thunder", "price": -110, "point": 3.5}]},
           {"key": "totals", "outcomes": [
             {"name": "Under", "price": -105, "point": 221.5},
             {"name": "Over", "price": -115, "point": 221.5}]}]},
         {"key": "fanduel", "markets": [
           {"key": "h2h", "outcomes": [
             {"name": "Oklahoma City Thunder", "price": 125},
             {"name": "Denver Nuggets", "price": -145}]}]}]},
      {"id": "ev2", "sport_key": "soccer_epl",
       "commence_time": "2026-02-02T15:00:00Z",
       "home_team": "Arsenal", "away_team": "Chelsea",
       "bookmakers": [
         {"key": "draftkings", "markets": [
           {"key": "h2h", "outcomes": [
             {"name": "Arsenal", "price": 120},
             {"name": "Chelsea", "price": 250},
             {"name": "Draw", "price": 230}]}]}]}
    ])");
    auto at = Clock::now();
    auto lines = OddsApiClient::parseEvents(events, "draftkings", at);
    ASSERT_EQ(lines.size(), 3u);

    const auto &ml = lines[0];
    ASSERT_TRUE(ml.type == MarketType::MONEYLINE);
    ASSERT_EQ(ml.outcome_a, std::string("Denver Nuggets"));
    ASSERT_NEAR(ml.quote_a.price, -150.0, 1e-12);
    ASSERT_NEAR(ml.quote_b.price, 130.0, 1e-12);
    ASSERT_TRUE(ml.quote_a.timestamp == at);
    ASSERT_TRUE(ml.start_time == gameTime());

    ASSERT_TRUE(lines[1].type == MarketType::SPREADS);
    ASSERT_NEAR(*lines[1].point, -3.5, 1e-12);

    ASSERT_TRUE(lines[2].type == MarketType::TOTALS);
    ASSERT_EQ(lines[2].outcome_a, std::string("Over"));
    ASSERT_NEAR(lines[2].quote_a.price, -115.0, 1e-12);
  });

  runTest("odds_api_requires_key", [] {
    ASSERT_THROWS(OddsApiClient("", "draftkings"), ConfigurationError);
    OddsApiClient client("k", "draftkings");
    ASSERT_EQ(client.creditsRemaining(), -1);
    ASSERT_EQ(std::string(OddsApiClient::marketKey(MarketType::TOTALS)),
              std::string("totals"));
  });

  // ─── 9. PAPER BOOKMAKER ─────────────────────────────────────────
  std::cout << "\n📄 paper_bookmaker.cpp\n";

  runTest("paper_bet_fills_at_quoted_price", [] {
    auto source = std::make_shared<MockOddsVenue>("draftkings", false);
    source->lines = {nbaLine("draftkings", gameTime(), -150, 150)};
    PaperBookmaker paper(source);
    ASSERT_TRUE(paper.capability() == VenueCapability::CAN_PLACE_ORDERS);
    paper.getLines("basketball_nba", {"us"}, {MarketType::MONEYLINE});

    BetRequest req;
    req.line_id = "draftkings:ev1:h2h";
    req.side = OutcomeSide::B;
    req.american_odds = 150;
    req.units = 10;
    auto h = paper.placeBet(req);
    auto st = paper.getBetStatus(h);
    ASSERT_TRUE(st.state == LegState::FILLED);
    ASSERT_NEAR(st.filled_size, 10.0, 1e-12);
    ASSERT_EQ(paper.betCount(), 1u);
  });

  runTest("paper_bet_rejected_when_line_moved", [] {
    auto source = std::make_shared<MockOddsVenue>("draftkings", false);
    source->lines = {nbaLine("draftkings", gameTime(), -150, 150)};
    PaperBookmaker paper(source);
    paper.getLines("basketball_nba", {"us"}, {MarketType::MONEYLINE});

    BetRequest req;
    req.line_id = "draftkings:ev1:h2h";
    req.side = OutcomeSide::B;
    req.american_odds = 160; // better than what is on offer
    req.units = 10;
    ASSERT_THROWS(paper.placeBet(req), RejectedOrder);

    req.line_id = "draftkings:missing:h2h";
    req.american_odds = 150;
    ASSERT_THROWS(paper.placeBet(req), RejectedOrder);
    ASSERT_EQ(paper.betCount(), 0u);
  });

  runTest("paper_bet_idempotent_by_client_ref", [] {
    auto source = std::make_shared<MockOddsVenue>("draftkings", false);
    source->lines = {nbaLine("draftkings", gameTime(), -150, 150)};
    PaperBookmaker paper(source);
    paper.getLines("basketball_nba", {"us"}, {MarketType::MONEYLINE});

    BetRequest req;
    req.line_id = "draftkings:ev1:h2h";
    req.side = OutcomeSide::B;
    req.american_odds = 150;
    req.units = 10;
    req.client_ref = "xarb-1-A#1-L2";
    ASSERT_FALSE(paper.findBet(req.client_ref).has_value());
    auto first = paper.placeBet(req);
    auto again = paper.placeBet(req);
    ASSERT_EQ(again.order_id, first.order_id);
    ASSERT_EQ(paper.betCount(), 1u);
    auto found = paper.findBet(req.client_ref);
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->order_id, first.order_id);
  });

  runTest("read_only_venue_refuses_bets", [] {
    MockOddsVenue ro("draftkings", false);
    BetRequest req;
    req.line_id = "x";
    ASSERT_THROWS(ro.placeBet(req), RejectedOrder);
  });

  // ─── 10. RETRY ──────────────────────────────────────────────────
  std::cout << "\n🔁 retry.hpp\n";

  runTest("retry_transient_then_success", [] {
    RetryPolicy p{3, 1, 2, 5};
    int calls = 0;
    int v = withRetry(
        [&] {
          if (++calls < 3)
            throw TransientVenueError("blip");
          return 7;
        },
        p, "test");
    ASSERT_EQ(v, 7);
    ASSERT_EQ(calls, 3);
  });

  runTest("retry_gives_up_after_max_attempts", [] {
    RetryPolicy p{2, 1, 2, 5};
    int calls = 0;
    ASSERT_THROWS(withRetry(
                      [&]() -> int {
                        calls++;
                        throw TransientVenueError("down");
                      },
                      p, "test"),
                  TransientVenueError);
    ASSERT_EQ(calls, 2);
  });

  runTest("retry_rejection_not_retried", [] {
    RetryPolicy p{5, 1, 2, 5};
    int calls = 0;
    ASSERT_THROWS(withRetry(
                      [&]() -> int {
                        calls++;
                        throw RejectedOrder("no");
                      },
                      p, "test"),
                  RejectedOrder);
    ASSERT_EQ(calls, 1);
  });

  runTest("retry_rate_limit_does_not_consume_attempts", [] {
    RetryPolicy p{1, 1, 2, 5};
    int calls = 0;
    int v = withRetry(
        [&] {
          if (++calls < 3)
            throw RateLimited("slow down", std::chrono::milliseconds(1));
          return 1;
        },
        p, "test");
    ASSERT_EQ(v, 1);
    ASSERT_EQ(calls, 3);
  });

  // ─── RESULTS ────────────────────────────────────────────────────
  return printResults();
}
