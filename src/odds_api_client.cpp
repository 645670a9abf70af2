#include "xarb/odds_api_client.hpp"
#include "xarb/errors.hpp"
#include "xarb/http.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace xarb {

OddsApiClient::OddsApiClient(const std::string &api_key,
                             const std::string &bookmaker,
                             const std::string &base_url)
    : api_key_(api_key), bookmaker_(bookmaker), base_url_(base_url) {
  if (api_key_.empty())
    throw ConfigurationError("ODDS_API_KEY is not set");
}

const char *OddsApiClient::marketKey(MarketType t) { return toString(t); }

void OddsApiClient::checkCredits() const {
  int left = credits_remaining_.load();
  if (left >= 0 && left < kMinCredits)
    throw Error("Odds API credits nearly exhausted: " + std::to_string(left) +
                " remaining");
}

// ── Parsing ──────────────────────────────────────────────────────────
static Quote makeQuote(const OddsLine &line, OutcomeSide side, double american,
                       Timestamp at) {
  Quote q;
  q.venue = line.venue;
  q.instrument_id = line.id();
  q.side = side;
  q.price = american;
  q.format = PriceFormat::AMERICAN;
  q.timestamp = at;
  return q;
}

std::vector<OddsLine> OddsApiClient::parseEvents(const json &events,
                                                 const std::string &bookmaker,
                                                 Timestamp fetched_at) {
  std::vector<OddsLine> lines;
  if (!events.is_array())
    return lines;

  for (const auto &ev : events) {
    auto start = parseIsoTimestamp(ev.value("commence_time", ""));
    if (!start)
      continue;

    for (const auto &bm : ev.value("bookmakers", json::array())) {
      if (bm.value("key", "") != bookmaker)
        continue;

      for (const auto &mkt : bm.value("markets", json::array())) {
        std::string key = mkt.value("key", "");
        auto outcomes = mkt.value("outcomes", json::array());
        if (outcomes.size() != 2)
          continue; // three-way markets have no complement

        OddsLine line;
        line.venue = bookmaker;
        line.event_id = ev.value("id", "");
        line.category = ev.value("sport_key", "");
        line.home = ev.value("home_team", "");
        line.away = ev.value("away_team", "");
        line.start_time = *start;

        const json *a = nullptr;
        const json *b = nullptr;
        if (key == "totals") {
          line.type = MarketType::TOTALS;
          for (const auto &o : outcomes) {
            std::string name = o.value("name", "");
            if (name == "Over")
              a = &o;
            else if (name == "Under")
              b = &o;
          }
        } else if (key == "h2h" || key == "spreads") {
          line.type = key == "h2h" ? MarketType::MONEYLINE : MarketType::SPREADS;
          for (const auto &o : outcomes) {
            std::string name = o.value("name", "");
            if (name == line.home)
              a = &o;
            else if (name == line.away)
              b = &o;
          }
        } else {
          continue;
        }
        auto isNum = [](const json *o, const char *k) {
          return o->contains(k) && o->at(k).is_number();
        };
        if (!a || !b || !isNum(a, "price") || !isNum(b, "price"))
          continue;

        if (line.type != MarketType::MONEYLINE) {
          if (!isNum(a, "point"))
            continue;
          line.point = a->at("point").get<double>();
        }
        line.outcome_a = a->at("name").get<std::string>();
        line.outcome_b = b->at("name").get<std::string>();
        line.quote_a = makeQuote(line, OutcomeSide::A,
                                 a->at("price").get<double>(), fetched_at);
        line.quote_b = makeQuote(line, OutcomeSide::B,
                                 b->at("price").get<double>(), fetched_at);
        lines.push_back(std::move(line));
      }
    }
  }
  return lines;
}

// ── Fetch ────────────────────────────────────────────────────────────
std::vector<OddsLine>
OddsApiClient::getLines(const std::string &sport,
                        const std::vector<std::string> &regions,
                        const std::vector<MarketType> &market_types) {
  checkCredits();

  auto join = [](const std::vector<std::string> &v) {
    std::string out;
    for (const auto &s : v)
      out += (out.empty() ? "" : ",") + s;
    return out;
  };
  std::vector<std::string> markets;
  for (auto t : market_types)
    markets.push_back(marketKey(t));
  if (markets.empty())
    markets.push_back("h2h");

  std::string url = base_url_ + "/sports/" + sport +
                    "/odds?apiKey=" + urlEncode(api_key_) +
                    "&regions=" + urlEncode(join(regions.empty()
                                                     ? std::vector<std::string>{"us"}
                                                     : regions)) +
                    "&markets=" + urlEncode(join(markets)) +
                    "&oddsFormat=american&bookmakers=" + urlEncode(bookmaker_);

  auto resp = httpRequest("GET", url, {"Accept: application/json"});

  auto remaining = resp.header("X-Requests-Remaining");
  auto used = resp.header("X-Requests-Used");
  try {
    if (!remaining.empty())
      credits_remaining_ = std::stoi(remaining);
    if (!used.empty())
      credits_used_ = std::stoi(used);
  } catch (const std::exception &) {
    spdlog::debug("[OddsAPI] Unreadable credit headers '{}' / '{}'", remaining,
                  used);
  }

  if (resp.status == 401 || resp.status == 403)
    throw ConfigurationError("Odds API authentication failed, check ODDS_API_KEY");
  if (resp.status == 429)
    throw RateLimited("Odds API rate limited", std::chrono::milliseconds(1000));
  if (resp.status >= 500)
    throw TransientVenueError("Odds API returned HTTP " +
                              std::to_string(resp.status));
  if (resp.status != 200)
    throw Error("Odds API returned HTTP " + std::to_string(resp.status) + ": " +
                resp.body.substr(0, 200));

  json data;
  try {
    data = json::parse(resp.body);
  } catch (const json::exception &e) {
    throw TransientVenueError(std::string("Odds API sent malformed JSON: ") +
                              e.what());
  }

  auto lines = parseEvents(data, bookmaker_, Clock::now());
  spdlog::info("[OddsAPI] {} {}: {} lines ({} credits left)", bookmaker_, sport,
               lines.size(), credits_remaining_.load());
  return lines;
}

} // namespace xarb
