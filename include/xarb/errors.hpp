#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace xarb {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Network failure, 5xx, or venue-side timeout. Retried with backoff.
class TransientVenueError : public Error {
public:
  using Error::Error;
};

// Venue asked us to back off. Not counted as a failure.
class RateLimited : public Error {
public:
  RateLimited(const std::string &what, std::chrono::milliseconds retry_after)
      : Error(what), retry_after_(retry_after) {}

  std::chrono::milliseconds retryAfter() const { return retry_after_; }

private:
  std::chrono::milliseconds retry_after_;
};

// Venue declined the order. Terminal for that leg.
class RejectedOrder : public Error {
public:
  using Error::Error;
};

// Snapshot older than its freshness bound.
class StaleData : public Error {
public:
  using Error::Error;
};

// Invalid caps or thresholds. Fatal at startup.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

// Leg2 failed after Leg1 filled.
class NakedExposureError : public Error {
public:
  NakedExposureError(const std::string &what, std::string attempt_id,
                     double units)
      : Error(what), attempt_id_(std::move(attempt_id)), units_(units) {}

  const std::string &attemptId() const { return attempt_id_; }
  double units() const { return units_; }

private:
  std::string attempt_id_;
  double units_;
};

} // namespace xarb
