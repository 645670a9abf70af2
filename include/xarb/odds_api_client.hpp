#pragma once
#include "xarb/venue.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace xarb {

// TheOddsAPI v4, read-only, one bookmaker per instance. Each bookmaker
// returned per event costs one credit; requests stop once fewer than
// kMinCredits remain.
class OddsApiClient : public OddsVenueClient {
public:
  static constexpr int kMinCredits = 10;

  OddsApiClient(const std::string &api_key, const std::string &bookmaker,
                const std::string &base_url = "https://api.the-odds-api.com/v4");

  std::string venueId() const override { return bookmaker_; }
  VenueCapability capability() const override {
    return VenueCapability::READ_ONLY;
  }
  std::vector<OddsLine>
  getLines(const std::string &sport, const std::vector<std::string> &regions,
           const std::vector<MarketType> &market_types) override;

  // -1 until the first response
  int creditsRemaining() const { return credits_remaining_.load(); }
  int creditsUsed() const { return credits_used_.load(); }

  static const char *marketKey(MarketType t);

  // Lines quoted by `bookmaker` in an /odds response. Quotes are stamped
  // with the fetch time.
  static std::vector<OddsLine> parseEvents(const nlohmann::json &events,
                                           const std::string &bookmaker,
                                           Timestamp fetched_at);

private:
  void checkCredits() const;

  std::string api_key_;
  std::string bookmaker_;
  std::string base_url_;
  std::atomic<int> credits_remaining_{-1};
  std::atomic<int> credits_used_{0};
};

} // namespace xarb
