#include "xarb/kalshi_client.hpp"
#include "xarb/errors.hpp"
#include "xarb/team_aliases.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <exception>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace xarb {

// Number field that may be missing or null
static double num(const json &j, const char *key, double fallback = 0.0) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number())
    return fallback;
  return it->get<double>();
}

static std::string str(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string())
    return "";
  return it->get<std::string>();
}

KalshiClient::KalshiClient(const Config &config, const std::string &base_url)
    : venue_id_(config.exchange_venue), base_url_(base_url),
      key_id_(config.kalshi_key_id), live_(config.live_mode) {
  const auto &key_path = config.kalshi_private_key_path;
  if (!key_path.empty()) {
    FILE *fp = fopen(key_path.c_str(), "r");
    if (!fp) {
      spdlog::error("[Kalshi] Cannot open private key: {}", key_path);
    } else {
      pkey_ = PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr);
      fclose(fp);
      if (!pkey_)
        spdlog::error("[Kalshi] Failed to parse private key");
    }
  }

  if (live_ && (!pkey_ || key_id_.empty()))
    throw ConfigurationError(
        "Live trading needs KALSHI_API_KEY_ID and a readable "
        "KALSHI_PRIVATE_KEY_PATH");
  if (!pkey_)
    spdlog::warn("[Kalshi] No API key loaded, using public endpoints only");
  spdlog::info("[Kalshi] Client ready ({} mode)", live_ ? "LIVE" : "paper");
}

KalshiClient::~KalshiClient() {
  if (pkey_)
    EVP_PKEY_free(static_cast<EVP_PKEY *>(pkey_));
}

// ── Base64 encoding ──────────────────────────────────────────────────
std::string KalshiClient::base64Encode(const unsigned char *buffer,
                                       size_t length) {
  BIO *bmem, *b64;
  BUF_MEM *bptr;

  b64 = BIO_new(BIO_f_base64());
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
  bmem = BIO_new(BIO_s_mem());
  b64 = BIO_push(b64, bmem);
  BIO_write(b64, buffer, static_cast<int>(length));
  BIO_flush(b64);
  BIO_get_mem_ptr(b64, &bptr);

  std::string result(bptr->data, bptr->length);
  BIO_free_all(b64);
  return result;
}

// ── RSA-PSS signing ─────────────────────────────────────────────────
std::string KalshiClient::signRequest(const std::string &timestamp,
                                      const std::string &method,
                                      const std::string &path) {
  if (!pkey_)
    return "";

  // Kalshi signs timestamp + method + path (no query string)
  std::string message = timestamp + method + path;

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  EVP_PKEY_CTX *pctx = nullptr;

  if (EVP_DigestSignInit(ctx, &pctx, EVP_sha256(), nullptr,
                         static_cast<EVP_PKEY *>(pkey_)) != 1) {
    EVP_MD_CTX_free(ctx);
    throw Error("Kalshi signing init failed");
  }

  EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING);
  EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST);

  size_t sig_len = 0;
  if (EVP_DigestSignUpdate(ctx, message.c_str(), message.size()) != 1 ||
      EVP_DigestSignFinal(ctx, nullptr, &sig_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw Error("Kalshi signing failed");
  }
  std::vector<unsigned char> sig(sig_len);
  int ok = EVP_DigestSignFinal(ctx, sig.data(), &sig_len);
  EVP_MD_CTX_free(ctx);
  if (ok != 1)
    throw Error("Kalshi signing failed");

  return base64Encode(sig.data(), sig_len);
}

// ── Authenticated HTTP ───────────────────────────────────────────────
HttpResponse KalshiClient::request(const std::string &method,
                                   const std::string &path,
                                   const std::string &body) {
  std::string url = base_url_ + path;

  // Signed path is everything after the host, minus the query
  std::string sign_path = url;
  auto scheme = sign_path.find("://");
  auto slash = sign_path.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  sign_path = slash == std::string::npos ? "/" : sign_path.substr(slash);
  sign_path = sign_path.substr(0, sign_path.find('?'));

  std::vector<std::string> headers = {"Accept: application/json"};
  if (!body.empty())
    headers.push_back("Content-Type: application/json");
  if (pkey_) {
    auto ts = std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now().time_since_epoch())
            .count());
    headers.push_back("KALSHI-ACCESS-KEY: " + key_id_);
    headers.push_back("KALSHI-ACCESS-SIGNATURE: " +
                      signRequest(ts, method, sign_path));
    headers.push_back("KALSHI-ACCESS-TIMESTAMP: " + ts);
  }
  return httpRequest(method, url, headers, body);
}

json KalshiClient::checked(const HttpResponse &resp, const std::string &what,
                           bool order_call) {
  if (resp.status == 429) {
    long long wait_ms = 1000;
    auto ra = resp.header("Retry-After");
    if (!ra.empty()) {
      try {
        wait_ms = static_cast<long long>(std::stod(ra) * 1000.0);
      } catch (const std::exception &) {
        spdlog::debug("[Kalshi] Unreadable Retry-After '{}'", ra);
      }
    }
    throw RateLimited("Kalshi rate limited on " + what,
                      std::chrono::milliseconds(wait_ms));
  }
  if (resp.status >= 500)
    throw TransientVenueError("Kalshi " + what + " returned HTTP " +
                              std::to_string(resp.status));
  if (resp.status == 401 || resp.status == 403)
    throw ConfigurationError("Kalshi authentication failed on " + what +
                             ", check KALSHI_API_KEY_ID and the private key");
  if (resp.status >= 400) {
    std::string msg = "Kalshi " + what + " returned HTTP " +
                      std::to_string(resp.status) + ": " + resp.body.substr(0, 200);
    if (order_call)
      throw RejectedOrder(msg);
    throw Error(msg);
  }

  try {
    return json::parse(resp.body);
  } catch (const json::exception &e) {
    throw TransientVenueError("Kalshi " + what + " sent malformed JSON: " +
                              e.what());
  }
}

// ── Sports series ────────────────────────────────────────────────────
std::string KalshiClient::seriesForSport(const std::string &sport) {
  if (sport == "basketball_nba")
    return "KXNBAGAME";
  if (sport == "icehockey_nhl")
    return "KXNHLGAME";
  if (sport == "americanfootball_nfl")
    return "KXNFLGAME";
  return "";
}

std::string KalshiClient::sportForSeries(const std::string &series) {
  if (series == "KXNBAGAME")
    return "basketball_nba";
  if (series == "KXNHLGAME")
    return "icehockey_nhl";
  if (series == "KXNFLGAME")
    return "americanfootball_nfl";
  return "";
}

// Markets expire roughly one game after tip-off
static std::chrono::minutes gameLength(const std::string &sport) {
  if (sport == "americanfootball_nfl")
    return std::chrono::minutes(195);
  return std::chrono::minutes(150);
}

static std::string squash(const std::string &s) {
  std::string out;
  for (unsigned char c : s)
    if (std::isalnum(c))
      out += static_cast<char>(std::toupper(c));
  return out;
}

std::optional<Instrument> KalshiClient::parseMarket(const json &m,
                                                    const std::string &series) {
  Instrument inst;
  inst.ticker = str(m, "ticker");
  inst.event_ticker = str(m, "event_ticker");
  inst.category = sportForSeries(series);
  std::string title = str(m, "title");
  if (inst.ticker.empty() || inst.category.empty())
    return std::nullopt;

  // KXNBAGAME-26FEB01OKCDEN-OKC: last segment is the team this YES pays on
  auto dash = inst.ticker.rfind('-');
  if (dash == std::string::npos || dash == inst.ticker.find('-'))
    return std::nullopt;
  std::string code = inst.ticker.substr(dash + 1);

  // "Oklahoma City at Denver Winner?"
  auto at = title.find(" at ");
  if (at == std::string::npos)
    return std::nullopt;
  std::string matchup = title.substr(0, title.find(" Winner?"));
  std::string away = matchup.substr(0, at);
  std::string home = matchup.substr(at + 4);
  if (home.empty() || away.empty())
    return std::nullopt;

  const auto &aliases = TeamAliases::instance();
  auto team = aliases.resolve(code, inst.category);
  if (team && team == aliases.resolve(home, inst.category))
    inst.outcome = home;
  else if (team && team == aliases.resolve(away, inst.category))
    inst.outcome = away;
  else if (squash(home).find(squash(code)) != std::string::npos)
    inst.outcome = home;
  else if (squash(away).find(squash(code)) != std::string::npos)
    inst.outcome = away;
  else
    return std::nullopt;

  inst.participants = {home, away};
  inst.type = ContractType::BINARY_WINNER;
  inst.yes_bid = num(m, "yes_bid") / 100.0;
  inst.yes_ask = num(m, "yes_ask") / 100.0;
  inst.volume = num(m, "volume");

  auto expires = parseIsoTimestamp(str(m, "expected_expiration_time"));
  if (!expires)
    expires = parseIsoTimestamp(str(m, "close_time"));
  if (!expires)
    return std::nullopt;
  inst.start_time = *expires - gameLength(inst.category);
  return inst;
}

OrderBook KalshiClient::parseOrderBook(const json &j, const std::string &ticker,
                                       Timestamp now) {
  OrderBook book;
  book.ticker = ticker;
  book.timestamp = now;

  auto ob = j.find("orderbook");
  if (ob == j.end() || !ob->is_object())
    return book;

  auto levels = [&](const char *side) {
    std::vector<OrderBookLevel> out;
    auto it = ob->find(side);
    if (it == ob->end() || !it->is_array())
      return out;
    for (const auto &lvl : *it) {
      if (!lvl.is_array() || lvl.size() < 2)
        continue;
      double cents = lvl[0].get<double>();
      double qty = lvl[1].get<double>();
      if (cents <= 0.0 || cents >= 100.0 || qty <= 0.0)
        continue;
      out.push_back({cents / 100.0, qty});
    }
    return out;
  };

  book.bids = levels("yes");
  for (const auto &no_bid : levels("no"))
    book.asks.push_back({1.0 - no_bid.price, no_bid.size});

  std::sort(book.bids.begin(), book.bids.end(),
            [](const auto &a, const auto &b) { return a.price > b.price; });
  std::sort(book.asks.begin(), book.asks.end(),
            [](const auto &a, const auto &b) { return a.price < b.price; });
  return book;
}

OrderStatus KalshiClient::parseOrder(const json &order) {
  OrderStatus st;
  std::string status = str(order, "status");

  if (order.contains("fill_count")) {
    st.filled_size = num(order, "fill_count");
  } else {
    double initial = num(order, "initial_count", num(order, "count"));
    st.filled_size = std::max(0.0, initial - num(order, "remaining_count", initial));
  }

  double cost_cents = num(order, "taker_fill_cost") + num(order, "maker_fill_cost");
  if (st.filled_size > 0.0 && cost_cents > 0.0)
    st.avg_price = cost_cents / 100.0 / st.filled_size;
  else
    st.avg_price = num(order, "yes_price") / 100.0;

  if (status == "executed")
    st.state = LegState::FILLED;
  else if (status == "canceled" || status == "cancelled")
    st.state = LegState::CANCELLED;
  else
    st.state = LegState::SUBMITTED;
  return st;
}

// ── Market data ──────────────────────────────────────────────────────
std::vector<Instrument>
KalshiClient::getInstruments(const InstrumentFilter &filter) {
  std::vector<std::string> sports = filter.categories;
  if (sports.empty())
    sports = {"basketball_nba", "icehockey_nhl", "americanfootball_nfl"};

  std::vector<Instrument> out;
  std::exception_ptr last_error;
  size_t ok = 0;

  for (const auto &sport : sports) {
    std::string series = seriesForSport(sport);
    if (series.empty()) {
      spdlog::debug("[Kalshi] No game series for {}", sport);
      continue;
    }
    try {
      auto data = checked(request("GET", "/markets?series_ticker=" + series +
                                             "&status=" + filter.status +
                                             "&limit=" +
                                             std::to_string(filter.limit)),
                          "markets " + series, false);
      ok++;
      size_t before = out.size();
      for (const auto &m : data.value("markets", json::array())) {
        if (auto inst = parseMarket(m, series))
          out.push_back(std::move(*inst));
      }
      spdlog::debug("[Kalshi] {}: {} markets", series, out.size() - before);
    } catch (const Error &e) {
      spdlog::error("[Kalshi] {} fetch failed: {}", series, e.what());
      last_error = std::current_exception();
    }
  }

  if (ok == 0 && last_error)
    std::rethrow_exception(last_error);
  spdlog::info("[Kalshi] Fetched {} game markets", out.size());
  return out;
}

OrderBook KalshiClient::getOrderBook(const std::string &ticker) {
  auto data = checked(request("GET", "/markets/" + ticker + "/orderbook"),
                      "orderbook " + ticker, false);
  return parseOrderBook(data, ticker, Clock::now());
}

// ── Orders ───────────────────────────────────────────────────────────
OrderHandle KalshiClient::placeOrder(const std::string &ticker, Side side,
                                     double price, double size,
                                     const std::string &client_order_id) {
  int count = static_cast<int>(std::floor(size + 1e-9));
  int price_cents = static_cast<int>(std::round(price * 100.0));
  if (count < 1)
    throw RejectedOrder("Order size below one contract: " + ticker);
  if (price_cents < 1 || price_cents > 99)
    throw RejectedOrder("Price out of range for " + ticker);

  spdlog::info("[Kalshi] Order {}: {} {} x{} @ {:.2f}{}", client_order_id,
               side == Side::BUY ? "BUY" : "SELL", ticker, count, price,
               live_ ? "" : " (paper)");

  if (!live_) {
    static std::atomic<long> seq{0};
    std::lock_guard<std::mutex> lock(paper_mtx_);
    auto known = paper_by_client_.find(client_order_id);
    if (!client_order_id.empty() && known != paper_by_client_.end())
      return known->second;
    std::string id = "PAPER_" + std::to_string(++seq);
    paper_orders_[id] = {LegState::FILLED, static_cast<double>(count),
                         price_cents / 100.0};
    OrderHandle h{venue_id_, id, ticker};
    if (!client_order_id.empty())
      paper_by_client_[client_order_id] = h;
    return h;
  }

  json body = {{"ticker", ticker},
               {"action", side == Side::BUY ? "buy" : "sell"},
               {"type", "limit"},
               {"side", "yes"},
               {"count", count},
               {"yes_price", price_cents},
               {"client_order_id", client_order_id}};

  auto data = checked(request("POST", "/portfolio/orders", body.dump()),
                      "order " + ticker, true);
  std::string order_id;
  if (data.contains("order") && data["order"].is_object())
    order_id = str(data["order"], "order_id");
  else
    order_id = str(data, "order_id");
  if (order_id.empty())
    throw RejectedOrder("Kalshi returned no order id for " + ticker);

  spdlog::info("[Kalshi] Order accepted: {}", order_id);
  return {venue_id_, order_id, ticker};
}

std::optional<std::string>
KalshiClient::orderIdForClient(const json &list,
                               const std::string &client_order_id) {
  if (client_order_id.empty())
    return std::nullopt;
  for (const auto &o : list.value("orders", json::array())) {
    if (o.is_object() && str(o, "client_order_id") == client_order_id) {
      std::string id = str(o, "order_id");
      if (!id.empty())
        return id;
    }
  }
  return std::nullopt;
}

std::optional<OrderHandle>
KalshiClient::findOrder(const std::string &ticker,
                        const std::string &client_order_id) {
  if (!live_) {
    std::lock_guard<std::mutex> lock(paper_mtx_);
    auto it = paper_by_client_.find(client_order_id);
    if (it == paper_by_client_.end())
      return std::nullopt;
    return it->second;
  }
  auto data = checked(request("GET", "/portfolio/orders?ticker=" + ticker +
                                         "&limit=100"),
                      "orders " + ticker, false);
  auto id = orderIdForClient(data, client_order_id);
  if (!id)
    return std::nullopt;
  spdlog::info("[Kalshi] Order {} already on the book as {}", client_order_id,
               *id);
  return OrderHandle{venue_id_, *id, ticker};
}

OrderStatus KalshiClient::getOrderStatus(const OrderHandle &handle) {
  if (!live_) {
    std::lock_guard<std::mutex> lock(paper_mtx_);
    auto it = paper_orders_.find(handle.order_id);
    if (it == paper_orders_.end())
      throw Error("Unknown paper order " + handle.order_id);
    return it->second;
  }
  auto data = checked(request("GET", "/portfolio/orders/" + handle.order_id),
                      "order status " + handle.order_id, false);
  return parseOrder(data.value("order", json::object()));
}

void KalshiClient::cancelOrder(const OrderHandle &handle) {
  if (!live_) {
    std::lock_guard<std::mutex> lock(paper_mtx_);
    auto it = paper_orders_.find(handle.order_id);
    if (it != paper_orders_.end() && it->second.state != LegState::FILLED)
      it->second.state = LegState::CANCELLED;
    return;
  }
  checked(request("DELETE", "/portfolio/orders/" + handle.order_id),
          "cancel " + handle.order_id, true);
  spdlog::info("[Kalshi] Cancelled {}", handle.order_id);
}

} // namespace xarb
