#include "xarb/paper_bookmaker.hpp"
#include "xarb/odds.hpp"
#include <spdlog/spdlog.h>

namespace xarb {

PaperBookmaker::PaperBookmaker(std::shared_ptr<OddsVenueClient> source)
    : source_(std::move(source)) {
  if (!source_)
    throw ConfigurationError("Paper bookmaker needs a line source");
}

std::vector<OddsLine>
PaperBookmaker::getLines(const std::string &sport,
                         const std::vector<std::string> &regions,
                         const std::vector<MarketType> &market_types) {
  auto lines = source_->getLines(sport, regions, market_types);
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto &l : lines)
    last_lines_[l.id()] = l;
  return lines;
}

OrderHandle PaperBookmaker::placeBet(const BetRequest &req) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto known = by_client_.find(req.client_ref);
  if (!req.client_ref.empty() && known != by_client_.end())
    return known->second;

  auto it = last_lines_.find(req.line_id);
  if (it == last_lines_.end())
    throw RejectedOrder("Line no longer offered: " + req.line_id);

  const Quote &q = it->second.quote(req.side);
  double offered = odds::toImplied(q.price, q.format);
  double asked = odds::americanToImplied(req.american_odds);
  // a higher implied probability means a worse price for the bettor
  if (offered > asked + 1e-9)
    throw RejectedOrder("Odds moved on " + req.line_id);
  if (req.units <= 0.0)
    throw RejectedOrder("Empty bet on " + req.line_id);

  std::string id = "PAPER_" + venueId() + "_" + std::to_string(next_id_++);
  bets_[id] = {LegState::FILLED, req.units, q.price};
  spdlog::info("[Paper] Bet {} on {}: {} @ {:+.0f} x{:.0f} (${:.2f})", id,
               venueId(), req.outcome, q.price, req.units, req.stake_usd);
  OrderHandle h{venueId(), id, req.line_id};
  if (!req.client_ref.empty())
    by_client_[req.client_ref] = h;
  return h;
}

std::optional<OrderHandle>
PaperBookmaker::findBet(const std::string &client_ref) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = by_client_.find(client_ref);
  if (it == by_client_.end())
    return std::nullopt;
  return it->second;
}

OrderStatus PaperBookmaker::getBetStatus(const OrderHandle &handle) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = bets_.find(handle.order_id);
  if (it == bets_.end())
    throw Error("Unknown paper bet " + handle.order_id);
  return it->second;
}

void PaperBookmaker::cancelBet(const OrderHandle &handle) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = bets_.find(handle.order_id);
  if (it != bets_.end() && it->second.state != LegState::FILLED)
    it->second.state = LegState::CANCELLED;
}

size_t PaperBookmaker::betCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return bets_.size();
}

} // namespace xarb
