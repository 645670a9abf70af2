#pragma once
#include "xarb/alerts.hpp"
#include "xarb/arb_detector.hpp"
#include "xarb/common.hpp"
#include "xarb/journal.hpp"
#include "xarb/legging_coordinator.hpp"
#include "xarb/market_matcher.hpp"
#include "xarb/opportunity_book.hpp"
#include "xarb/portfolio_manager.hpp"
#include "xarb/risk_manager.hpp"
#include "xarb/venue.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace xarb {

// Read-only view for dashboards and status endpoints.
struct DashboardSnapshot {
  Timestamp at;
  long cycle = 0;
  bool halted = false;
  std::string halt_reason;
  std::vector<Opportunity> opportunities;
  std::vector<ExecutionAttempt> open_attempts;
  ExposureState exposure;
  std::vector<Position> unhedged;

  nlohmann::json toJson() const;
};

struct CycleReport {
  ScanRecord record;
  std::vector<Opportunity> detected;
  std::vector<std::shared_future<ExecutionAttempt>> dispatched;
};

// One scan cycle: fetch, match, detect, filter, dispatch. Wires the
// portfolio, risk manager and journal as attempt observers.
class Scanner {
public:
  Scanner(const Config &config, VenueRegistry &venues,
          PortfolioManager &portfolio, RiskManager &risk,
          LeggingCoordinator &coordinator, RecordSink *journal = nullptr,
          AlertSink *alerts = nullptr);

  // Venue failures skip the affected pairs. ConfigurationError propagates.
  CycleReport runCycle(Timestamp now = Clock::now());

  // Cycle every scan_interval_ms until keep_running() returns false or a
  // ConfigurationError is raised.
  void run(const std::function<bool()> &keep_running);

  DashboardSnapshot snapshot() const;
  const OpportunityBook &book() const { return book_; }

private:
  std::vector<OddsLine> fetchLines(const std::vector<MarketType> &types,
                                   int &skipped);

  Config config_;
  VenueRegistry &venues_;
  PortfolioManager &portfolio_;
  RiskManager &risk_;
  LeggingCoordinator &coordinator_;
  RecordSink *journal_;
  AlertSink *alerts_;

  MarketMatcher matcher_;
  ArbDetector detector_;
  OpportunityBook book_;
  std::atomic<long> cycle_{0};
};

} // namespace xarb
