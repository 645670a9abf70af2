#include "xarb/journal.hpp"
#include <filesystem>
#include <iomanip>
#include <spdlog/spdlog.h>

namespace xarb {

// Quote a field if it would break the row
static std::string csvField(const std::string &s) {
  if (s.find_first_of(",\"\n") == std::string::npos)
    return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"')
      out += '"';
    out += c;
  }
  return out + "\"";
}

CsvJournal::CsvJournal(const std::string &dir) : dir_(dir) {
  std::filesystem::create_directories(dir_);

  scan_csv_.open(dir_ + "/scans.csv", std::ios::app);
  opp_csv_.open(dir_ + "/opportunities.csv", std::ios::app);
  attempt_csv_.open(dir_ + "/attempts.csv", std::ios::app);
  if (!scan_csv_ || !opp_csv_ || !attempt_csv_)
    throw std::runtime_error("Cannot open journal files in " + dir_);
  ensureHeaders();
}

CsvJournal::~CsvJournal() {
  if (scan_csv_.is_open())
    scan_csv_.close();
  if (opp_csv_.is_open())
    opp_csv_.close();
  if (attempt_csv_.is_open())
    attempt_csv_.close();
}

void CsvJournal::ensureHeaders() {
  // file_size, not tellp(): tellp() is unreliable with ios::app
  namespace fs = std::filesystem;
  auto dir = fs::path(dir_);

  if (fs::file_size(dir / "scans.csv") == 0) {
    scan_csv_ << "timestamp,cycle,instruments,lines,pairs,opportunities,"
                 "emitted,dispatched,skipped,elapsed_ms\n";
    scan_csv_.flush();
  }
  if (fs::file_size(dir / "opportunities.csv") == 0) {
    opp_csv_ << "timestamp,pair_key,hedge_venue,edge,max_size,exchange_cost,"
                "hedge_prob,executable,leg1_venue,leg2_venue,description\n";
    opp_csv_.flush();
  }
  if (fs::file_size(dir / "attempts.csv") == 0) {
    attempt_csv_ << "timestamp,attempt_id,pair_key,state,leg1_venue,"
                    "leg1_state,leg1_filled,leg1_price,leg2_venue,leg2_state,"
                    "leg2_filled,leg2_price,planned_edge,realized_edge,"
                    "hedged_units,unhedged_units,realized_pnl,duration_ms\n";
    attempt_csv_.flush();
  }
}

void CsvJournal::recordScan(const ScanRecord &scan) {
  std::lock_guard<std::mutex> lock(mtx_);
  scan_csv_ << isoTimestamp(scan.at) << "," << scan.cycle << ","
            << scan.instruments << "," << scan.lines << "," << scan.pairs << ","
            << scan.opportunities << "," << scan.emitted << ","
            << scan.dispatched << "," << scan.skipped << "," << std::fixed
            << std::setprecision(1) << scan.elapsed_ms << "\n";
  scan_csv_.flush();
}

void CsvJournal::recordOpportunity(const Opportunity &opp) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::string leg1 = opp.legs.size() > 0 ? opp.legs[0].venue : "";
  std::string leg2 = opp.legs.size() > 1 ? opp.legs[1].venue : "";

  opp_csv_ << isoTimestamp(opp.detected_at) << "," << csvField(opp.pair_key)
           << "," << opp.hedge_venue << "," << std::fixed
           << std::setprecision(4) << opp.edge << "," << std::setprecision(0)
           << opp.max_size << "," << std::setprecision(4) << opp.exchange_cost
           << "," << opp.hedge_prob << "," << (opp.executable ? 1 : 0) << ","
           << leg1 << "," << leg2 << "," << csvField(opp.description) << "\n";
  opp_csv_.flush();
}

void CsvJournal::recordAttempt(const ExecutionAttempt &a) {
  std::lock_guard<std::mutex> lock(mtx_);
  double duration =
      std::chrono::duration<double, std::milli>(a.finished_at - a.started_at)
          .count();

  attempt_csv_ << isoTimestamp(a.finished_at) << "," << a.id << ","
               << csvField(a.opportunity.pair_key) << "," << toString(a.state)
               << "," << a.leg1.plan.venue << "," << toString(a.leg1.state)
               << "," << std::fixed << std::setprecision(0)
               << a.leg1.filled_size << "," << std::setprecision(4)
               << a.leg1.avg_price << "," << a.leg2.plan.venue << ","
               << toString(a.leg2.state) << "," << std::setprecision(0)
               << a.leg2.filled_size << "," << std::setprecision(4)
               << a.leg2.avg_price << "," << a.planned_edge << ","
               << a.realized_edge << "," << std::setprecision(0)
               << a.hedged_units << "," << a.unhedged_units << ","
               << std::setprecision(4) << a.realized_pnl << ","
               << std::setprecision(1) << duration << "\n";
  attempt_csv_.flush();

  if (a.state == AttemptState::BOTH_FILLED) {
    spdlog::info("✅ [Journal] {} filled: edge {:.4f} → {:.4f}, pnl ${:.2f}",
                 a.id, a.planned_edge, a.realized_edge, a.realized_pnl);
  } else {
    spdlog::warn("⚠️  [Journal] {} {}", a.id, toString(a.state));
  }
}

} // namespace xarb
