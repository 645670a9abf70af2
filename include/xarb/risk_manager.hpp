#pragma once
#include "xarb/alerts.hpp"
#include "xarb/arb_detector.hpp"
#include "xarb/common.hpp"
#include "xarb/portfolio_manager.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

struct RiskDecision {
  bool approved = false;
  std::string reason;
};

// Pre-trade gate, venue ranking, throttle detection and kill switch.
// All exposure numbers come from the PortfolioManager; this class keeps only
// the rejection history and the halt flag.
class RiskManager : public VenueRanker {
public:
  RiskManager(const Config &config, PortfolioManager &portfolio,
              AlertSink *alerts = nullptr);

  // Run every check against the live ledger and reserve the opportunity's
  // outlays if they pass, atomically.
  RiskDecision checkAndReserve(const Opportunity &opp);

  // Pure check against a given state, no reservation. Returns the first
  // failing rule.
  std::optional<std::string> check(const Opportunity &opp,
                                   const ExposureState &state) const;

  // Most remaining daily headroom, then least recent activity, then largest
  // per-bet cap. Flagged venues go last.
  std::vector<std::string>
  rankVenues(const std::vector<std::string> &candidates) const override;

  // Observer hook for terminal attempts.
  void onAttemptFinished(const ExecutionAttempt &attempt);

  // Trip the switch if today's loss or the drawdown breach their limits.
  bool evaluateKillSwitch();

  bool halted() const { return halted_.load(); }
  std::string haltReason() const;
  void resetKillSwitch();
  void clearVenueFlag(const std::string &venue);

private:
  double perBetCap(const std::string &venue) const;
  void trip(const std::string &reason);

  Config config_;
  PortfolioManager &portfolio_;
  AlertSink *alerts_;

  std::atomic<bool> halted_{false};
  std::string halt_reason_;
  std::map<std::string, std::deque<Timestamp>> leg2_rejections_;
  mutable std::mutex mtx_;
};

} // namespace xarb
