#pragma once
#include "xarb/common.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

// Latest opportunity per pair key. The whole arena is swapped every cycle.
class OpportunityBook {
public:
  OpportunityBook(double edge_noise, int stale_ms);

  // Install a cycle's detections. Keys absent from `cycle` are dropped. An
  // entry whose edge is within the noise threshold of the edge last emitted
  // for its key takes the new prices and sizes but keeps its consumed flag
  // and is not emitted again. Returns the entries that are new or
  // materially changed.
  std::vector<Opportunity> replace(std::vector<Opportunity> cycle);

  // Hand out an entry exactly once. Stale entries are dropped instead.
  std::optional<Opportunity> take(const std::string &pair_key, Timestamp now);

  std::vector<Opportunity> current() const;
  size_t size() const;

private:
  struct Entry {
    Opportunity opp;
    bool consumed = false;
    double emitted_edge = 0.0; // edge when last returned by replace()
  };

  double edge_noise_;
  int stale_ms_;
  std::map<std::string, Entry> entries_;
  mutable std::mutex mtx_;
};

} // namespace xarb
