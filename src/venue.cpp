#include "xarb/venue.hpp"
#include <spdlog/spdlog.h>

namespace xarb {

void VenueRegistry::setExchange(std::shared_ptr<ExchangeClient> client) {
  exchange_ = std::move(client);
}

void VenueRegistry::addOddsVenue(std::shared_ptr<OddsVenueClient> client) {
  auto id = client->venueId();
  if (odds_.count(id))
    spdlog::warn("[Venues] Replacing odds venue {}", id);
  odds_[id] = std::move(client);
}

OddsVenueClient *VenueRegistry::odds(const std::string &venue_id) const {
  auto it = odds_.find(venue_id);
  return it == odds_.end() ? nullptr : it->second.get();
}

std::vector<std::string> VenueRegistry::oddsVenueIds() const {
  std::vector<std::string> ids;
  for (const auto &[id, c] : odds_)
    ids.push_back(id);
  return ids;
}

bool VenueRegistry::canPlaceOrders(const std::string &venue_id) const {
  auto *c = odds(venue_id);
  return c && c->capability() == VenueCapability::CAN_PLACE_ORDERS;
}

} // namespace xarb
