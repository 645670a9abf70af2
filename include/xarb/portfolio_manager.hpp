#pragma once
#include "xarb/common.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

// Sole writer of ExposureState and the position ledger. Everything else
// reads through snapshot().
class PortfolioManager {
public:
  // Returns a rejection reason, or nullopt to approve.
  using Check =
      std::function<std::optional<std::string>(const ExposureState &)>;

  explicit PortfolioManager(const Config &config);

  ExposureState snapshot() const;
  std::vector<Position> positions() const;
  std::vector<Position> unhedgedPositions() const;
  double reservedUsd(const std::string &pair_key) const;

  // Run `check` against the live state and, if it approves, reserve the
  // opportunity's leg outlays, all under the writer lock.
  std::optional<std::string> reserveIf(const Opportunity &opp,
                                       const Check &check);
  void releaseReservation(const std::string &pair_key);

  // Book a terminal attempt: release its reservation, add volume and open
  // exposure, lock in hedged P&L, open a position.
  void recordAttempt(const ExecutionAttempt &attempt);

  // Close a position at its payout. Realizes whatever was not locked in.
  bool settlePosition(const std::string &id, double payout_usd);

  // Sell off a position's unhedged residual for `proceeds_usd`.
  bool recordUnwind(const std::string &id, double proceeds_usd);

  void flagVenue(const std::string &venue, const std::string &reason);
  void clearVenueFlag(const std::string &venue);

  // Throws NakedExposureError if any position carries unhedged units.
  void requireFlat() const;

  // Reset daily fields when the UTC day changes.
  void rollDay(Timestamp now);

  void save(const std::string &path) const;
  bool load(const std::string &path);

private:
  VenueExposure &venueLocked(const std::string &venue);
  void rollDayLocked(Timestamp now);
  void releaseLocked(const std::string &pair_key);
  void bookPnlLocked(const std::string &venue, double pnl);
  Position *findLocked(const std::string &id);

  Config config_;
  ExposureState state_;
  std::map<std::string, std::map<std::string, double>> reservations_;
  std::vector<Position> positions_;
  mutable std::mutex mtx_;
};

} // namespace xarb
