#pragma once
#include "xarb/common.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace xarb {

struct ScanRecord {
  long cycle = 0;
  Timestamp at;
  int instruments = 0;
  int lines = 0;
  int pairs = 0;
  int opportunities = 0; // detected this cycle
  int emitted = 0;       // new or materially changed
  int dispatched = 0;
  int skipped = 0; // stale pairs and venue errors
  double elapsed_ms = 0.0;
};

// Append-only record of what the bot saw and did.
class RecordSink {
public:
  virtual ~RecordSink() = default;
  virtual void recordScan(const ScanRecord &scan) = 0;
  virtual void recordOpportunity(const Opportunity &opp) = 0;
  virtual void recordAttempt(const ExecutionAttempt &attempt) = 0;
};

// scans.csv, opportunities.csv and attempts.csv under one directory.
class CsvJournal : public RecordSink {
public:
  explicit CsvJournal(const std::string &dir = "logs");
  ~CsvJournal() override;

  void recordScan(const ScanRecord &scan) override;
  void recordOpportunity(const Opportunity &opp) override;
  void recordAttempt(const ExecutionAttempt &attempt) override;

  const std::string &dir() const { return dir_; }

private:
  void ensureHeaders();

  std::string dir_;
  std::ofstream scan_csv_;
  std::ofstream opp_csv_;
  std::ofstream attempt_csv_;
  std::mutex mtx_;
};

} // namespace xarb
