#pragma once
#include "xarb/common.hpp"
#include "xarb/errors.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

// ── Exchange side ────────────────────────────────────────────────────
struct InstrumentFilter {
  std::vector<std::string> categories; // sport keys; empty = all supported
  std::string status = "open";
  int limit = 500;
};

struct OrderHandle {
  std::string venue;
  std::string order_id;
  std::string instrument_id;
};

struct OrderStatus {
  LegState state = LegState::SUBMITTED;
  double filled_size = 0.0;
  double avg_price = 0.0;
};

// Binary-outcome contract exchange. Implementations throw
// TransientVenueError, RateLimited or RejectedOrder.
//
// `client_order_id` is chosen by the caller and stays the same across
// retries of one order. findOrder() resolves it after a lost reply, so a
// retry never places a second order for the same leg.
class ExchangeClient {
public:
  virtual ~ExchangeClient() = default;

  virtual std::string venueId() const = 0;
  virtual std::vector<Instrument>
  getInstruments(const InstrumentFilter &filter) = 0;
  virtual OrderBook getOrderBook(const std::string &ticker) = 0;
  virtual OrderHandle placeOrder(const std::string &ticker, Side side,
                                 double price, double size,
                                 const std::string &client_order_id) = 0;
  virtual std::optional<OrderHandle>
  findOrder(const std::string &ticker, const std::string &client_order_id) = 0;
  virtual OrderStatus getOrderStatus(const OrderHandle &handle) = 0;
  virtual void cancelOrder(const OrderHandle &handle) = 0;
};

// ── Odds venue side ──────────────────────────────────────────────────
enum class VenueCapability { READ_ONLY, CAN_PLACE_ORDERS };

struct BetRequest {
  std::string line_id;
  std::string event_id;
  OutcomeSide side = OutcomeSide::A;
  std::string outcome;
  double american_odds = 0.0;
  double units = 0.0;     // $1-payout units
  double stake_usd = 0.0; // units * implied
  std::string client_ref; // same on every retry of this bet
};

class OddsVenueClient {
public:
  virtual ~OddsVenueClient() = default;

  virtual std::string venueId() const = 0;
  virtual VenueCapability capability() const = 0;
  virtual std::vector<OddsLine>
  getLines(const std::string &sport, const std::vector<std::string> &regions,
           const std::vector<MarketType> &market_types) = 0;

  // Order methods exist only on venues that can place orders.
  virtual OrderHandle placeBet(const BetRequest &req) {
    throw RejectedOrder(venueId() + " is read-only: " + req.line_id);
  }
  virtual std::optional<OrderHandle> findBet(const std::string &client_ref) {
    throw RejectedOrder(venueId() + " is read-only: " + client_ref);
  }
  virtual OrderStatus getBetStatus(const OrderHandle &handle) {
    throw RejectedOrder(venueId() + " is read-only: " + handle.order_id);
  }
  virtual void cancelBet(const OrderHandle &handle) {
    throw RejectedOrder(venueId() + " is read-only: " + handle.order_id);
  }
};

// Venue clients by id. Owns the clients.
class VenueRegistry {
public:
  void setExchange(std::shared_ptr<ExchangeClient> client);
  void addOddsVenue(std::shared_ptr<OddsVenueClient> client);

  ExchangeClient *exchange() const { return exchange_.get(); }
  OddsVenueClient *odds(const std::string &venue_id) const;
  std::vector<std::string> oddsVenueIds() const;
  bool canPlaceOrders(const std::string &venue_id) const;

private:
  std::shared_ptr<ExchangeClient> exchange_;
  std::map<std::string, std::shared_ptr<OddsVenueClient>> odds_;
};

} // namespace xarb
