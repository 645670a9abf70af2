#pragma once
#include "xarb/common.hpp"
#include "xarb/http.hpp"
#include "xarb/venue.hpp"
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

// Kalshi REST v2 exchange client. Requests are signed with RSA-PSS when a
// key is loaded. In paper mode orders never leave the process: they fill
// immediately at the limit price.
class KalshiClient : public ExchangeClient {
public:
  KalshiClient(const Config &config,
               const std::string &base_url =
                   "https://api.elections.kalshi.com/trade-api/v2");
  ~KalshiClient() override;

  KalshiClient(const KalshiClient &) = delete;
  KalshiClient &operator=(const KalshiClient &) = delete;

  std::string venueId() const override { return venue_id_; }
  std::vector<Instrument>
  getInstruments(const InstrumentFilter &filter) override;
  OrderBook getOrderBook(const std::string &ticker) override;
  OrderHandle placeOrder(const std::string &ticker, Side side, double price,
                         double size,
                         const std::string &client_order_id) override;
  std::optional<OrderHandle>
  findOrder(const std::string &ticker,
            const std::string &client_order_id) override;
  OrderStatus getOrderStatus(const OrderHandle &handle) override;
  void cancelOrder(const OrderHandle &handle) override;

  bool paper() const { return !live_; }

  // ── Parsing (no network) ──
  static std::string seriesForSport(const std::string &sport);
  static std::string sportForSeries(const std::string &series);

  // One game-winner market. nullopt if the title or ticker can't be read.
  static std::optional<Instrument> parseMarket(const nlohmann::json &m,
                                               const std::string &series);

  // {"orderbook": {"yes": [[cents, qty]], "no": [[cents, qty]]}} into a
  // YES book. YES asks are the complement of NO bids.
  static OrderBook parseOrderBook(const nlohmann::json &j,
                                  const std::string &ticker, Timestamp now);

  static OrderStatus parseOrder(const nlohmann::json &order);

  // Order id of the entry in {"orders": [...]} carrying `client_order_id`.
  static std::optional<std::string>
  orderIdForClient(const nlohmann::json &list,
                   const std::string &client_order_id);

private:
  HttpResponse request(const std::string &method, const std::string &path,
                       const std::string &body = "");
  nlohmann::json checked(const HttpResponse &resp, const std::string &what,
                         bool order_call);
  std::string signRequest(const std::string &timestamp,
                          const std::string &method, const std::string &path);
  static std::string base64Encode(const unsigned char *buffer, size_t length);

  std::string venue_id_;
  std::string base_url_;
  std::string key_id_;
  bool live_;
  void *pkey_ = nullptr; // EVP_PKEY*

  std::map<std::string, OrderStatus> paper_orders_;
  std::map<std::string, OrderHandle> paper_by_client_;
  std::mutex paper_mtx_;
};

} // namespace xarb
