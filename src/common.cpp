#include "xarb/common.hpp"
#include "xarb/odds.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace xarb {

std::string OddsLine::id() const {
  std::ostringstream ss;
  ss << venue << ":" << event_id << ":" << toString(type);
  if (point)
    ss << ":" << std::fixed << std::setprecision(1) << *point;
  return ss.str();
}

double Opportunity::worstCaseLossUsd() const {
  // a naked leg can lose its whole stake
  double worst = 0.0;
  for (const auto &l : legs)
    worst = std::max(worst, odds::stakeForUnits(l.price, l.format, l.size));
  return worst;
}

const char *toString(AttemptState s) {
  switch (s) {
  case AttemptState::PLANNED:
    return "PLANNED";
  case AttemptState::LEG1_SUBMITTED:
    return "LEG1_SUBMITTED";
  case AttemptState::LEG1_FILLED:
    return "LEG1_FILLED";
  case AttemptState::LEG1_PARTIAL_FILL:
    return "LEG1_PARTIAL_FILL";
  case AttemptState::LEG1_REJECTED:
    return "LEG1_REJECTED";
  case AttemptState::LEG1_TIMED_OUT:
    return "LEG1_TIMED_OUT";
  case AttemptState::LEG2_SUBMITTED:
    return "LEG2_SUBMITTED";
  case AttemptState::BOTH_FILLED:
    return "BOTH_FILLED";
  case AttemptState::LEG2_PARTIAL_FILL:
    return "LEG2_PARTIAL_FILL";
  case AttemptState::LEG2_REJECTED:
    return "LEG2_REJECTED";
  case AttemptState::LEG2_TIMED_OUT:
    return "LEG2_TIMED_OUT";
  case AttemptState::ABANDONED:
    return "ABANDONED";
  case AttemptState::NAKED_EXPOSURE:
    return "NAKED_EXPOSURE";
  }
  return "UNKNOWN";
}

const char *toString(LegState s) {
  switch (s) {
  case LegState::PENDING:
    return "PENDING";
  case LegState::SUBMITTED:
    return "SUBMITTED";
  case LegState::FILLED:
    return "FILLED";
  case LegState::PARTIALLY_FILLED:
    return "PARTIALLY_FILLED";
  case LegState::REJECTED:
    return "REJECTED";
  case LegState::TIMED_OUT:
    return "TIMED_OUT";
  case LegState::CANCELLED:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

const char *toString(MarketType t) {
  switch (t) {
  case MarketType::MONEYLINE:
    return "h2h";
  case MarketType::SPREADS:
    return "spreads";
  case MarketType::TOTALS:
    return "totals";
  }
  return "unknown";
}

const char *toString(ContractType t) {
  switch (t) {
  case ContractType::BINARY_WINNER:
    return "winner";
  case ContractType::SPREAD:
    return "spread";
  case ContractType::TOTAL:
    return "total";
  }
  return "unknown";
}

// ── Timestamps (UTC, ISO-8601) ───────────────────────────────────────
std::string isoTimestamp(Timestamp t) {
  auto tt = Clock::to_time_t(t);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                t.time_since_epoch()) %
            1000;
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count() << 'Z';
  return ss.str();
}

std::optional<Timestamp> parseIsoTimestamp(const std::string &s) {
  std::tm tm{};
  std::istringstream ss(s);
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail())
    return std::nullopt;
  return Clock::from_time_t(timegm(&tm));
}

} // namespace xarb
