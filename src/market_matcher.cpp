#include "xarb/market_matcher.hpp"
#include "xarb/team_aliases.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <iterator>
#include <spdlog/spdlog.h>

namespace xarb {

static constexpr double kPointEps = 1e-6;

MarketMatcher::MarketMatcher(const Config &config)
    : name_weight_(config.name_weight), time_weight_(config.time_weight),
      threshold_(config.match_threshold),
      tolerance_s_(static_cast<double>(config.time_tolerance_s)) {}

// ── Text tokenization ────────────────────────────────────────────────
std::vector<std::string> MarketMatcher::tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string word;

  auto flush = [&] {
    if (!word.empty() && word != "the" && word != "at" && word != "vs" &&
        word != "fc")
      tokens.push_back(word);
    word.clear();
  };

  for (char c : text) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::isalnum(u))
      word += static_cast<char>(std::tolower(u));
    else if (c != '.' && c != '\'')
      flush();
  }
  flush();
  return tokens;
}

// ── Token overlap ────────────────────────────────────────────────────
double MarketMatcher::jaccardSimilarity(const std::vector<std::string> &a,
                                        const std::vector<std::string> &b) {
  auto distinct = [](std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
    return v;
  };
  auto ta = distinct(a);
  auto tb = distinct(b);
  if (ta.empty() && tb.empty())
    return 0.0;

  std::vector<std::string> shared;
  std::set_intersection(ta.begin(), ta.end(), tb.begin(), tb.end(),
                        std::back_inserter(shared));
  double overlap = static_cast<double>(shared.size());
  return overlap / (ta.size() + tb.size() - overlap);
}

// ── Normalized Levenshtein ───────────────────────────────────────────
double MarketMatcher::editSimilarity(const std::string &a,
                                     const std::string &b) {
  if (a.empty() && b.empty())
    return 1.0;
  std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); j++)
    prev[j] = j;
  for (size_t i = 1; i <= a.size(); i++) {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); j++) {
      size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
    }
    std::swap(prev, cur);
  }
  double dist = static_cast<double>(prev[b.size()]);
  return 1.0 - dist / static_cast<double>(std::max(a.size(), b.size()));
}

double MarketMatcher::nameSimilarity(const std::string &a, const std::string &b,
                                     const std::string &sport) {
  const auto &aliases = TeamAliases::instance();
  std::string ca = aliases.canonical(a, sport);
  std::string cb = aliases.canonical(b, sport);
  if (ca.empty() || cb.empty())
    return 0.0;
  if (ca == cb)
    return 1.0;
  return 0.5 * editSimilarity(ca, cb) +
         0.5 * jaccardSimilarity(tokenize(ca), tokenize(cb));
}

double MarketMatcher::timeProximity(Timestamp a, Timestamp b) const {
  double dt = std::abs(
      std::chrono::duration<double>(a - b).count());
  if (dt >= tolerance_s_)
    return 0.0;
  return 1.0 - dt / tolerance_s_;
}

double MarketMatcher::confidence(double name_score, double time_score) const {
  return name_weight_ * name_score + time_weight_ * time_score;
}

bool MarketMatcher::compatible(ContractType contract, MarketType market) {
  switch (contract) {
  case ContractType::BINARY_WINNER:
    return market == MarketType::MONEYLINE;
  case ContractType::SPREAD:
    return market == MarketType::SPREADS;
  case ContractType::TOTAL:
    return market == MarketType::TOTALS;
  }
  return false;
}

// Both participant orders; keep the better alignment.
double MarketMatcher::participantScore(const Instrument &inst,
                                       const OddsLine &line) const {
  if (inst.participants.size() < 2)
    return 0.0;
  const auto &p0 = inst.participants[0];
  const auto &p1 = inst.participants[1];
  const auto &sport = inst.category;

  double straight = (nameSimilarity(p0, line.home, sport) +
                     nameSimilarity(p1, line.away, sport)) /
                    2.0;
  double swapped = (nameSimilarity(p0, line.away, sport) +
                    nameSimilarity(p1, line.home, sport)) /
                   2.0;
  return std::max(straight, swapped);
}

// Which side of the line pays on the same outcome as the contract's YES.
std::optional<OutcomeSide>
MarketMatcher::contractSide(const Instrument &inst, const OddsLine &line) const {
  if (inst.type == ContractType::TOTAL) {
    if (!inst.point || !line.point ||
        std::abs(*inst.point - *line.point) > kPointEps)
      return std::nullopt;
    auto tokens = tokenize(inst.outcome);
    if (std::find(tokens.begin(), tokens.end(), "over") != tokens.end())
      return OutcomeSide::A;
    if (std::find(tokens.begin(), tokens.end(), "under") != tokens.end())
      return OutcomeSide::B;
    return std::nullopt;
  }

  double home = nameSimilarity(inst.outcome, line.home, inst.category);
  double away = nameSimilarity(inst.outcome, line.away, inst.category);
  if (home == away)
    return std::nullopt;
  OutcomeSide side = home > away ? OutcomeSide::A : OutcomeSide::B;

  if (inst.type == ContractType::SPREAD) {
    if (!inst.point || !line.point ||
        std::abs(std::abs(*inst.point) - std::abs(*line.point)) > kPointEps)
      return std::nullopt;
    // side B carries the negated point
    double side_point = side == OutcomeSide::A ? *line.point : -*line.point;
    if (std::abs(side_point - *inst.point) > kPointEps)
      return std::nullopt;
  }
  return side;
}

std::optional<PairedLine> MarketMatcher::score(const Instrument &inst,
                                               const OddsLine &line) const {
  if (inst.category != line.category)
    return std::nullopt;
  if (!compatible(inst.type, line.type))
    return std::nullopt;

  auto side = contractSide(inst, line);
  if (!side)
    return std::nullopt;

  PairedLine p;
  p.line = line;
  p.hedge_side = opposite(*side);
  p.basis.name_score = participantScore(inst, line);
  p.basis.time_score = timeProximity(inst.start_time, line.start_time);
  p.basis.market_type = line.type;
  p.confidence = confidence(p.basis.name_score, p.basis.time_score);
  return p;
}

static bool betterLine(const PairedLine &a, const PairedLine &b) {
  constexpr double eps = 1e-12;
  if (std::abs(a.confidence - b.confidence) > eps)
    return a.confidence > b.confidence;
  if (std::abs(a.basis.time_score - b.basis.time_score) > eps)
    return a.basis.time_score > b.basis.time_score;
  return a.basis.name_score > b.basis.name_score;
}

// ── Match instruments against lines ─────────────────────────────────
std::vector<MatchedPair>
MarketMatcher::match(const std::vector<Instrument> &instruments,
                     const std::vector<OddsLine> &lines) const {
  std::vector<MatchedPair> pairs;

  // Bucket lines by sport so each instrument only sees its category
  std::map<std::string, std::vector<const OddsLine *>> by_category;
  for (const auto &l : lines)
    by_category[l.category].push_back(&l);

  size_t scored = 0;
  for (const auto &inst : instruments) {
    auto it = by_category.find(inst.category);
    if (it == by_category.end())
      continue;

    std::map<std::string, PairedLine> best; // venue -> line
    for (const OddsLine *line : it->second) {
      auto p = score(inst, *line);
      if (!p)
        continue;
      scored++;
      if (p->confidence < threshold_)
        continue;
      auto cur = best.find(line->venue);
      if (cur == best.end())
        best.emplace(line->venue, std::move(*p));
      else if (betterLine(*p, cur->second))
        cur->second = std::move(*p);
    }

    if (best.empty())
      continue;

    MatchedPair pair;
    pair.instrument = inst;
    for (auto &[venue, p] : best)
      pair.lines.push_back(std::move(p));
    std::sort(pair.lines.begin(), pair.lines.end(), betterLine);
    pair.confidence = pair.lines.front().confidence;
    spdlog::debug("[Matcher] {} ↔ {} venue(s), best {} conf={:.3f}",
                  inst.ticker, pair.lines.size(), pair.lines.front().line.venue,
                  pair.confidence);
    pairs.push_back(std::move(pair));
  }

  spdlog::info("[Matcher] {} instruments × {} lines → {} scored, {} pairs",
               instruments.size(), lines.size(), scored, pairs.size());
  return pairs;
}

} // namespace xarb
