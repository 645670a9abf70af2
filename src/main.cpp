#include "xarb/alerts.hpp"
#include "xarb/config.hpp"
#include "xarb/errors.hpp"
#include "xarb/journal.hpp"
#include "xarb/kalshi_client.hpp"
#include "xarb/legging_coordinator.hpp"
#include "xarb/odds_api_client.hpp"
#include "xarb/paper_bookmaker.hpp"
#include "xarb/portfolio_manager.hpp"
#include "xarb/risk_manager.hpp"
#include "xarb/scanner.hpp"
#include "xarb/venue.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace xarb;

static volatile std::sig_atomic_t running = 1;

static void signalHandler(int) { running = 0; }

struct Options {
  std::string config_path;
  std::optional<bool> live;
  bool once = false;
  std::optional<int> interval_s;
  std::optional<double> min_edge;
  std::vector<std::string> sports;
  std::string state;
  std::string log_level = "info";
};

static std::vector<std::string> splitList(const std::string &s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ','))
    if (!item.empty())
      out.push_back(item);
  return out;
}

static void printHelp() {
  std::cout << R"(
╔═══════════════════════════════════════════════════════════╗
║          XARB — Exchange vs Sportsbook Arbitrage          ║
║        Kalshi contracts · two-leg hedges · risk caps      ║
╚═══════════════════════════════════════════════════════════╝

Usage: xarb [OPTIONS]

Options:
  --config <FILE>       JSON config file (defaults are built in)
  --live                Place real exchange orders (default: paper)
  --paper               Paper trading mode (default)
  --once                Run a single scan cycle and exit
  --interval <SEC>      Scan interval in seconds (default: 2)
  --min-edge <X>        Minimum edge per $1 unit (default: 0.01)
  --sports <a,b>        Sport keys (default: NBA, NHL, NFL)
  --state <XX>          Use the sportsbooks licensed in a US state
  --log-level <L>       trace|debug|info|warn|error|critical|off
  --help, -h            Show this help

Environment:
  KALSHI_API_KEY_ID        Kalshi API key id (live mode)
  KALSHI_PRIVATE_KEY_PATH  Kalshi RSA private key, PEM (live mode)
  ODDS_API_KEY             TheOddsAPI key
)";
}

// ── Parse CLI args ──────────────────────────────────────────────────
static Options parseArgs(int argc, char *argv[]) {
  Options opt;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "--live")
      opt.live = true;
    else if (arg == "--paper")
      opt.live = false;
    else if (arg == "--once")
      opt.once = true;
    else if (arg == "--config" && has_value)
      opt.config_path = argv[++i];
    else if (arg == "--interval" && has_value)
      opt.interval_s = std::stoi(argv[++i]);
    else if (arg == "--min-edge" && has_value)
      opt.min_edge = std::stod(argv[++i]);
    else if (arg == "--sports" && has_value)
      opt.sports = splitList(argv[++i]);
    else if (arg == "--state" && has_value)
      opt.state = argv[++i];
    else if (arg == "--log-level" && has_value)
      opt.log_level = argv[++i];
    else if (arg == "--help" || arg == "-h") {
      printHelp();
      std::exit(0);
    } else {
      throw ConfigurationError("Unknown or incomplete option: " + arg);
    }
  }
  return opt;
}

static Config buildConfig(const Options &opt) {
  Config cfg = opt.config_path.empty() ? Config{} : loadConfig(opt.config_path);
  applyEnv(cfg);

  if (opt.live)
    cfg.live_mode = *opt.live;
  if (opt.interval_s)
    cfg.scan_interval_ms = *opt.interval_s * 1000;
  if (opt.min_edge)
    cfg.min_edge = *opt.min_edge;
  if (!opt.sports.empty())
    cfg.sports = opt.sports;

  // Odds venues: the state preset, else whatever the config lists
  std::vector<std::string> books;
  if (!opt.state.empty()) {
    books = bookmakersForState(opt.state);
    if (books.empty())
      throw ConfigurationError("No bookmaker preset for state '" + opt.state +
                               "'");
  } else {
    for (const auto &v : cfg.venues)
      if (v.kind == VenueKind::ODDS)
        books.push_back(v.id);
  }
  if (books.empty()) {
    spdlog::info("[Config] No odds venues configured, using the NY preset");
    books = bookmakersForState("ny");
  }
  for (const auto &b : books)
    if (!cfg.venue(b))
      cfg.venues.push_back(defaultOddsVenue(b));
  if (!opt.state.empty()) {
    // A state preset restricts the odds venues to licensed books
    std::vector<VenueConfig> kept;
    for (const auto &v : cfg.venues)
      if (v.kind == VenueKind::EXCHANGE ||
          std::find(books.begin(), books.end(), v.id) != books.end())
        kept.push_back(v);
    cfg.venues = kept;
  }

  validateConfig(cfg);
  return cfg;
}

static void writeDashboard(const Scanner &scanner, const std::string &dir) {
  std::ofstream out(dir + "/dashboard.json");
  if (!out) {
    spdlog::warn("[Dashboard] Cannot write {}/dashboard.json", dir);
    return;
  }
  out << scanner.snapshot().toJson().dump(2) << "\n";
}

// ── Main pipeline ────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  // Setup logging
  auto console = spdlog::stdout_color_mt("xarb");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  Options opt;
  Config cfg;
  try {
    opt = parseArgs(argc, argv);
    spdlog::set_level(spdlog::level::from_str(opt.log_level));
    cfg = buildConfig(opt);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  // Signal handler for graceful shutdown
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  // Banner
  spdlog::info("╔═══════════════════════════════════════════════════════╗");
  spdlog::info("║        XARB — Exchange vs Sportsbook Arbitrage        ║");
  spdlog::info("╚═══════════════════════════════════════════════════════╝");
  spdlog::info("Mode: {}", cfg.live_mode ? "🔴 LIVE" : "📝 PAPER");
  spdlog::info("Scan interval: {}ms", cfg.scan_interval_ms);
  spdlog::info("Min edge: {:.4f}", cfg.min_edge);
  spdlog::info("Odds API: {}", cfg.odds_api_key.empty() ? "❌ missing" : "✅");

  try {
    std::filesystem::create_directories(cfg.data_dir);

    // ── Venues ───────────────────────────────────────────────────────
    VenueRegistry venues;
    venues.setExchange(std::make_shared<KalshiClient>(cfg));
    for (const auto &v : cfg.venues) {
      if (v.kind != VenueKind::ODDS)
        continue;
      auto feed = std::make_shared<OddsApiClient>(cfg.odds_api_key, v.id);
      if (cfg.live_mode) {
        // No bookmaker order API: live lines are alert-only
        venues.addOddsVenue(feed);
      } else {
        venues.addOddsVenue(std::make_shared<PaperBookmaker>(feed));
      }
      spdlog::info("[Venues] {} ({})", v.id,
                   cfg.live_mode ? "alert-only" : "paper");
    }

    // ── Components ───────────────────────────────────────────────────
    std::string state_path = cfg.data_dir + "/portfolio.json";
    PortfolioManager portfolio(cfg);
    if (portfolio.load(state_path))
      spdlog::info("[Portfolio] Restored state from {}", state_path);

    auto alerts =
        std::make_shared<AsyncAlertDispatcher>(std::make_shared<LogAlertSink>());
    RiskManager risk(cfg, portfolio, alerts.get());
    CsvJournal journal(cfg.data_dir);
    int exit_code = 0;
    {
      LeggingCoordinator coordinator(cfg, venues, alerts.get());
      Scanner scanner(cfg, venues, portfolio, risk, coordinator, &journal,
                      alerts.get());

      try {
        if (opt.once) {
          scanner.runCycle();
          coordinator.waitIdle();
        } else {
          scanner.run([] { return running != 0; });
        }
      } catch (const ConfigurationError &e) {
        spdlog::critical("Configuration error: {}", e.what());
        exit_code = 1;
      }

      coordinator.waitIdle();
      writeDashboard(scanner, cfg.data_dir);
    }

    portfolio.save(state_path);
    alerts->stop();

    auto unhedged = portfolio.unhedgedPositions();
    if (!unhedged.empty())
      spdlog::warn("⚠️  {} position(s) still carry unhedged units",
                   unhedged.size());
    spdlog::info("Shutting down gracefully.");
    return exit_code;
  } catch (const ConfigurationError &e) {
    spdlog::critical("Configuration error: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::critical("Fatal: {}", e.what());
    return 1;
  }
}
