#pragma once
#include "xarb/venue.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

// Dry-run order placement on top of a read-only odds feed. Bets fill in
// full at the last seen price, or are rejected when the line has moved
// against us or disappeared since the last getLines().
class PaperBookmaker : public OddsVenueClient {
public:
  explicit PaperBookmaker(std::shared_ptr<OddsVenueClient> source);

  std::string venueId() const override { return source_->venueId(); }
  VenueCapability capability() const override {
    return VenueCapability::CAN_PLACE_ORDERS;
  }
  std::vector<OddsLine>
  getLines(const std::string &sport, const std::vector<std::string> &regions,
           const std::vector<MarketType> &market_types) override;

  OrderHandle placeBet(const BetRequest &req) override;
  std::optional<OrderHandle> findBet(const std::string &client_ref) override;
  OrderStatus getBetStatus(const OrderHandle &handle) override;
  void cancelBet(const OrderHandle &handle) override;

  size_t betCount() const;

private:
  std::shared_ptr<OddsVenueClient> source_;
  std::map<std::string, OddsLine> last_lines_; // by line id
  std::map<std::string, OrderStatus> bets_;
  std::map<std::string, OrderHandle> by_client_;
  long next_id_ = 1;
  mutable std::mutex mtx_;
};

} // namespace xarb
