#pragma once
#include "xarb/common.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xarb {

// Pairs exchange contracts with odds-venue lines for the same event and
// proposition. Stateless: every call rebuilds the pairs from scratch.
class MarketMatcher {
public:
  explicit MarketMatcher(const Config &config);

  // Pairs scoring >= match_threshold, at most one line per venue per
  // instrument. Instruments with no candidate line produce no pair.
  std::vector<MatchedPair> match(const std::vector<Instrument> &instruments,
                                 const std::vector<OddsLine> &lines) const;

  // Score one candidate. nullopt if category or market type is incompatible,
  // or the line carries no side equivalent to the contract.
  std::optional<PairedLine> score(const Instrument &inst,
                                  const OddsLine &line) const;

  // Weighted score, monotone in both components.
  double confidence(double name_score, double time_score) const;

  // 1 - |dt| / tolerance, 0 beyond tolerance
  double timeProximity(Timestamp a, Timestamp b) const;

  // Similarity of two team names after alias canonicalization, in [0, 1]
  static double nameSimilarity(const std::string &a, const std::string &b,
                               const std::string &sport);

  static bool compatible(ContractType contract, MarketType market);

  static std::vector<std::string> tokenize(const std::string &text);
  static double jaccardSimilarity(const std::vector<std::string> &a,
                                  const std::vector<std::string> &b);
  static double editSimilarity(const std::string &a, const std::string &b);

private:
  double participantScore(const Instrument &inst, const OddsLine &line) const;
  std::optional<OutcomeSide> contractSide(const Instrument &inst,
                                          const OddsLine &line) const;

  double name_weight_;
  double time_weight_;
  double threshold_;
  double tolerance_s_;
};

} // namespace xarb
