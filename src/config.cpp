#include "xarb/config.hpp"
#include "xarb/errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

using json = nlohmann::json;

namespace xarb {

// ── State-licensed bookmaker presets ─────────────────────────────────
// Offshore books are excluded from every preset.
static const std::map<std::string, std::vector<std::string>> kStateBookmakers = {
    {"ny", {"fanduel", "draftkings", "betmgm", "caesars"}},
    {"nj", {"fanduel", "draftkings", "betmgm", "caesars", "betrivers", "unibet"}},
    {"pa",
     {"fanduel", "draftkings", "betmgm", "caesars", "betrivers", "unibet",
      "barstool"}},
    {"il",
     {"fanduel", "draftkings", "betmgm", "caesars", "betrivers", "barstool"}},
    {"nv", {"fanduel", "draftkings", "betmgm", "caesars"}},
    {"mi",
     {"fanduel", "draftkings", "betmgm", "caesars", "betrivers", "barstool"}},
    {"oh",
     {"fanduel", "draftkings", "betmgm", "caesars", "betrivers", "barstool"}},
    {"co",
     {"fanduel", "draftkings", "betmgm", "caesars", "betrivers", "barstool"}},
};

std::vector<std::string> bookmakersForState(const std::string &state) {
  std::string key;
  for (char c : state)
    key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  auto it = kStateBookmakers.find(key);
  if (it == kStateBookmakers.end())
    return {};
  return it->second;
}

VenueConfig defaultOddsVenue(const std::string &id) {
  VenueConfig v;
  v.id = id;
  v.kind = VenueKind::ODDS;
  v.fees = {FeeKind::NONE, 0.0}; // vig is already in the price
  v.max_bet_usd = 50.0;
  v.max_daily_volume_usd = 500.0;
  v.confirm_latency_ms = 5000;
  v.read_only = false;
  return v;
}

// ── JSON parsing ─────────────────────────────────────────────────────
static FeeKind parseFeeKind(const std::string &s) {
  if (s == "none")
    return FeeKind::NONE;
  if (s == "proportional")
    return FeeKind::PROPORTIONAL;
  if (s == "exchange_quadratic")
    return FeeKind::EXCHANGE_QUADRATIC;
  if (s == "winnings_commission")
    return FeeKind::WINNINGS_COMMISSION;
  throw ConfigurationError("Unknown fee model: " + s);
}

static VenueConfig parseVenue(const json &j) {
  if (!j.contains("id"))
    throw ConfigurationError("Venue entry without an id");

  std::string id = j["id"].get<std::string>();
  std::string kind = j.value("kind", "odds");
  VenueConfig v = kind == "exchange" ? VenueConfig{} : defaultOddsVenue(id);
  v.id = id;
  if (kind == "exchange") {
    v.kind = VenueKind::EXCHANGE;
    v.fees = {FeeKind::EXCHANGE_QUADRATIC, 0.07};
  } else if (kind != "odds") {
    throw ConfigurationError("Unknown venue kind for " + id + ": " + kind);
  }

  if (j.contains("fee_model"))
    v.fees.kind = parseFeeKind(j["fee_model"].get<std::string>());
  v.fees.rate = j.value("fee_rate", v.fees.rate);
  v.max_bet_usd = j.value("max_bet_usd", v.max_bet_usd);
  v.max_daily_volume_usd = j.value("max_daily_volume_usd", v.max_daily_volume_usd);
  v.confirm_latency_ms = j.value("confirm_latency_ms", v.confirm_latency_ms);
  v.read_only = j.value("read_only", v.read_only);
  return v;
}

Config parseConfig(const std::string &json_text, Config cfg) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error &e) {
    throw ConfigurationError(std::string("Invalid config JSON: ") + e.what());
  }
  if (!j.is_object())
    throw ConfigurationError("Config root must be an object");

  try {
    cfg.live_mode = j.value("live_mode", cfg.live_mode);
    cfg.scan_interval_ms = j.value("scan_interval_ms", cfg.scan_interval_ms);
    cfg.stale_ms = j.value("stale_ms", cfg.stale_ms);
    cfg.quote_freshness_ms = j.value("quote_freshness_ms", cfg.quote_freshness_ms);

    cfg.min_edge = j.value("min_edge", cfg.min_edge);
    cfg.edge_noise = j.value("edge_noise", cfg.edge_noise);
    cfg.venue_equivalence = j.value("venue_equivalence", cfg.venue_equivalence);
    cfg.max_units = j.value("max_units", cfg.max_units);

    cfg.match_threshold = j.value("match_threshold", cfg.match_threshold);
    cfg.name_weight = j.value("name_weight", cfg.name_weight);
    cfg.time_weight = j.value("time_weight", cfg.time_weight);
    cfg.time_tolerance_s = j.value("time_tolerance_s", cfg.time_tolerance_s);

    cfg.leg1_timeout_ms = j.value("leg1_timeout_ms", cfg.leg1_timeout_ms);
    cfg.leg2_timeout_ms = j.value("leg2_timeout_ms", cfg.leg2_timeout_ms);
    cfg.poll_interval_ms = j.value("poll_interval_ms", cfg.poll_interval_ms);

    if (j.contains("retry")) {
      const auto &r = j["retry"];
      cfg.retry.max_attempts = r.value("max_attempts", cfg.retry.max_attempts);
      cfg.retry.base_delay_ms = r.value("base_delay_ms", cfg.retry.base_delay_ms);
      cfg.retry.max_delay_ms = r.value("max_delay_ms", cfg.retry.max_delay_ms);
      cfg.retry.max_rate_limit_waits =
          r.value("max_rate_limit_waits", cfg.retry.max_rate_limit_waits);
    }

    cfg.min_actionable_units = j.value("min_actionable_units", cfg.min_actionable_units);
    cfg.max_global_exposure_usd =
        j.value("max_global_exposure_usd", cfg.max_global_exposure_usd);
    cfg.max_daily_loss_usd = j.value("max_daily_loss_usd", cfg.max_daily_loss_usd);
    cfg.max_drawdown_usd = j.value("max_drawdown_usd", cfg.max_drawdown_usd);
    cfg.throttle_rejections = j.value("throttle_rejections", cfg.throttle_rejections);
    cfg.throttle_window_s = j.value("throttle_window_s", cfg.throttle_window_s);

    cfg.exchange_venue = j.value("exchange_venue", cfg.exchange_venue);
    if (j.contains("venues")) {
      cfg.venues.clear();
      for (const auto &v : j["venues"])
        cfg.venues.push_back(parseVenue(v));
    }
    if (j.contains("sports"))
      cfg.sports = j["sports"].get<std::vector<std::string>>();
    if (j.contains("regions"))
      cfg.regions = j["regions"].get<std::vector<std::string>>();
    cfg.data_dir = j.value("data_dir", cfg.data_dir);
  } catch (const json::exception &e) {
    throw ConfigurationError(std::string("Bad config value: ") + e.what());
  }
  return cfg;
}

Config loadConfig(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ConfigurationError("Cannot open config file: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  spdlog::info("[Config] Loaded {}", path);
  return parseConfig(ss.str());
}

void applyEnv(Config &cfg) {
  if (auto *v = std::getenv("KALSHI_API_KEY_ID"))
    cfg.kalshi_key_id = v;
  if (auto *v = std::getenv("KALSHI_PRIVATE_KEY_PATH"))
    cfg.kalshi_private_key_path = v;
  if (auto *v = std::getenv("ODDS_API_KEY"))
    cfg.odds_api_key = v;
}

// ── Validation ───────────────────────────────────────────────────────
static void require(bool ok, const std::string &what) {
  if (!ok)
    throw ConfigurationError("Invalid configuration: " + what);
}

void validateConfig(Config &cfg) {
  require(cfg.scan_interval_ms > 0, "scan_interval_ms must be > 0");
  require(cfg.stale_ms > 0, "stale_ms must be > 0");
  require(cfg.quote_freshness_ms > 0, "quote_freshness_ms must be > 0");
  require(cfg.min_edge >= 0.0 && cfg.min_edge < 1.0, "min_edge must be in [0, 1)");
  require(cfg.edge_noise >= 0.0, "edge_noise must be >= 0");
  require(cfg.venue_equivalence >= 0.0, "venue_equivalence must be >= 0");
  require(cfg.max_units > 0.0, "max_units must be > 0");
  require(cfg.match_threshold > 0.0 && cfg.match_threshold <= 1.0,
          "match_threshold must be in (0, 1]");
  require(cfg.name_weight >= 0.0 && cfg.time_weight >= 0.0 &&
              std::abs(cfg.name_weight + cfg.time_weight - 1.0) < 1e-9,
          "name_weight + time_weight must equal 1");
  require(cfg.time_tolerance_s > 0, "time_tolerance_s must be > 0");
  require(cfg.leg1_timeout_ms > 0 && cfg.leg2_timeout_ms > 0,
          "leg timeouts must be > 0");
  require(cfg.poll_interval_ms > 0, "poll_interval_ms must be > 0");
  require(cfg.retry.max_attempts >= 1, "retry.max_attempts must be >= 1");
  require(cfg.min_actionable_units > 0.0, "min_actionable_units must be > 0");
  require(cfg.max_global_exposure_usd > 0.0, "max_global_exposure_usd must be > 0");
  require(cfg.max_daily_loss_usd > 0.0, "max_daily_loss_usd must be > 0");
  require(cfg.max_drawdown_usd > 0.0, "max_drawdown_usd must be > 0");
  require(cfg.throttle_rejections >= 1, "throttle_rejections must be >= 1");
  require(cfg.throttle_window_s > 0, "throttle_window_s must be > 0");

  const VenueConfig *exchange = cfg.venue(cfg.exchange_venue);
  require(exchange != nullptr, "exchange venue '" + cfg.exchange_venue +
                                   "' has no venue entry");
  require(exchange->kind == VenueKind::EXCHANGE,
          "venue '" + cfg.exchange_venue + "' is not an exchange");

  for (auto &v : cfg.venues) {
    require(!v.id.empty(), "venue id must not be empty");
    require(v.max_bet_usd > 0.0, v.id + ".max_bet_usd must be > 0");
    require(v.max_daily_volume_usd >= v.max_bet_usd,
            v.id + ".max_daily_volume_usd must be >= max_bet_usd");
    require(v.fees.rate >= 0.0 && v.fees.rate < 1.0,
            v.id + ".fee_rate must be in [0, 1)");
    require(v.confirm_latency_ms >= 0, v.id + ".confirm_latency_ms must be >= 0");
    if (v.max_bet_usd > cfg.hard_max_leg_usd) {
      spdlog::warn("[Config] {} max_bet_usd {:.2f} clamped to hard cap {:.2f}",
                   v.id, v.max_bet_usd, cfg.hard_max_leg_usd);
      v.max_bet_usd = cfg.hard_max_leg_usd;
    }
  }
}

} // namespace xarb
