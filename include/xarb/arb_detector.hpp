#pragma once
#include "xarb/common.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xarb {

class VenueRegistry;

// Orders candidate odds venues best-first for venue rotation.
class VenueRanker {
public:
  virtual ~VenueRanker() = default;
  virtual std::vector<std::string>
  rankVenues(const std::vector<std::string> &candidates) const = 0;
};

// Per-line evaluation, kept for rotation and journaling.
struct LineEdge {
  const PairedLine *line = nullptr;
  double exchange_cost = 0.0; // fee-adjusted ask
  double hedge_prob = 0.0;    // de-vigged, fee-adjusted
  double edge = 0.0;
  double locked_margin = 0.0; // 1 - a_adj - hedge cost actually paid
};

// Scores matched pairs in the BuyExchangeHedgeOdds direction:
//   edge = q_hedge_adj - a_adj
// where a_adj is the exchange YES ask plus taker fee and q_hedge_adj the
// proportionally de-vigged implied probability of the hedge side after the
// odds venue's fee. A line only clears if the hedged pair also locks in at
// least min_edge per unit at the prices actually paid:
//   locked_margin = 1 - a_adj - (p_hedge + fee)
// with p_hedge the hedge side's raw (vigged) implied probability.
class ArbDetector {
public:
  ArbDetector(const Config &config, const VenueRanker *ranker = nullptr,
              const VenueRegistry *venues = nullptr);

  // Best opportunity for the pair, or nullopt if no line clears min_edge.
  // Throws StaleData if the book or any line is older than the freshness
  // bound.
  std::optional<Opportunity> evaluate(const MatchedPair &pair,
                                      const OrderBook &book,
                                      const ExposureState &exposure,
                                      Timestamp now) const;

  // Edge of one line against the book, no sizing.
  std::optional<LineEdge> lineEdge(const PairedLine &line,
                                   const OrderBook &book) const;

  // Largest size both legs can take right now.
  double maxSize(const OrderBook &book, const PairedLine &line,
                 const ExposureState &exposure) const;

private:
  double capUnits(const std::string &venue, double price_per_unit,
                  const ExposureState &exposure) const;
  Opportunity buildPlan(const MatchedPair &pair, const LineEdge &le,
                        const OrderBook &book, double size,
                        Timestamp now) const;

  Config config_;
  VenueConfig exchange_;
  const VenueRanker *ranker_;
  const VenueRegistry *venues_;
};

} // namespace xarb
