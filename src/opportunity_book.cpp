#include "xarb/opportunity_book.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace xarb {

OpportunityBook::OpportunityBook(double edge_noise, int stale_ms)
    : edge_noise_(edge_noise), stale_ms_(stale_ms) {}

std::vector<Opportunity>
OpportunityBook::replace(std::vector<Opportunity> cycle) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::map<std::string, Entry> next;
  std::vector<Opportunity> emitted;

  for (auto &opp : cycle) {
    auto old = entries_.find(opp.pair_key);
    if (old != entries_.end() &&
        std::abs(old->second.emitted_edge - opp.edge) <= edge_noise_) {
      // same trade re-observed: current book, same consumed state
      Entry kept = old->second;
      kept.opp = std::move(opp);
      next[kept.opp.pair_key] = std::move(kept);
      continue;
    }
    emitted.push_back(opp);
    std::string key = opp.pair_key;
    double edge = opp.edge;
    next[key] = Entry{std::move(opp), false, edge};
  }

  size_t dropped = 0;
  for (const auto &[key, e] : entries_)
    if (!next.count(key))
      dropped++;

  entries_ = std::move(next);
  if (!emitted.empty() || dropped > 0)
    spdlog::debug("[Book] {} live, {} new/changed, {} dropped", entries_.size(),
                  emitted.size(), dropped);
  return emitted;
}

std::optional<Opportunity> OpportunityBook::take(const std::string &pair_key,
                                                 Timestamp now) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = entries_.find(pair_key);
  if (it == entries_.end() || it->second.consumed)
    return std::nullopt;

  if (ageMs(it->second.opp.detected_at, now) > stale_ms_) {
    spdlog::debug("[Book] {} stale, discarded", pair_key);
    entries_.erase(it);
    return std::nullopt;
  }
  it->second.consumed = true;
  return it->second.opp;
}

std::vector<Opportunity> OpportunityBook::current() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Opportunity> out;
  for (const auto &[key, e] : entries_)
    if (!e.consumed)
      out.push_back(e.opp);
  return out;
}

size_t OpportunityBook::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_.size();
}

} // namespace xarb
