#include "xarb/odds.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace xarb {
namespace odds {

// ── American / decimal / implied ─────────────────────────────────────
double americanToImplied(double american) {
  if (std::abs(american) < 100.0)
    throw std::invalid_argument("American odds must satisfy |odds| >= 100, got " +
                                std::to_string(american));
  if (american < 0)
    return -american / (-american + 100.0);
  return 100.0 / (american + 100.0);
}

double impliedToAmerican(double p) {
  if (!(p > 0.0 && p < 1.0))
    throw std::invalid_argument("Probability must be in (0, 1), got " +
                                std::to_string(p));
  if (p >= 0.5)
    return -(p * 100.0) / (1.0 - p);
  return (100.0 * (1.0 - p)) / p;
}

int impliedToAmericanRounded(double p) {
  return static_cast<int>(std::lround(impliedToAmerican(p)));
}

double americanToDecimal(double american) {
  return 1.0 / americanToImplied(american);
}

double decimalToImplied(double decimal) {
  if (decimal <= 1.0)
    throw std::invalid_argument("Decimal odds must be > 1, got " +
                                std::to_string(decimal));
  return 1.0 / decimal;
}

double impliedToDecimal(double p) {
  if (!(p > 0.0 && p < 1.0))
    throw std::invalid_argument("Probability must be in (0, 1), got " +
                                std::to_string(p));
  return 1.0 / p;
}

double toImplied(double price, PriceFormat format) {
  switch (format) {
  case PriceFormat::AMERICAN:
    return americanToImplied(price);
  case PriceFormat::DECIMAL:
    return decimalToImplied(price);
  case PriceFormat::PROBABILITY:
    break;
  }
  if (price < 0.0 || price > 1.0)
    throw std::invalid_argument("Probability price out of range: " +
                                std::to_string(price));
  return price;
}

// ── De-vig ───────────────────────────────────────────────────────────
Eigen::VectorXd devigProportional(const Eigen::VectorXd &implied) {
  double total = implied.sum();
  if (total <= 0.0)
    throw std::invalid_argument("Cannot de-vig an empty book");
  return implied / total;
}

Eigen::VectorXd devigPower(const Eigen::VectorXd &implied, int max_iters,
                           double tol) {
  if (implied.size() == 0 || (implied.array() <= 0.0).any())
    throw std::invalid_argument("Power de-vig needs positive probabilities");

  // Newton on f(k) = sum(p_i^k) - 1, f'(k) = sum(p_i^k ln p_i)
  Eigen::ArrayXd logp = implied.array().log();
  double k = 1.0;
  for (int it = 0; it < max_iters; it++) {
    Eigen::ArrayXd pk = (logp * k).exp();
    double f = pk.sum() - 1.0;
    if (std::abs(f) < tol)
      break;
    double df = (pk * logp).sum();
    if (df == 0.0)
      break;
    k -= f / df;
  }
  return (logp * k).exp().matrix();
}

// ── Fees ─────────────────────────────────────────────────────────────
double feePerUnit(double p, const FeeModel &fees) {
  switch (fees.kind) {
  case FeeKind::PROPORTIONAL:
    return fees.rate * p;
  case FeeKind::EXCHANGE_QUADRATIC:
    return fees.rate * p * (1.0 - p);
  case FeeKind::WINNINGS_COMMISSION:
    return fees.rate * (1.0 - p);
  case FeeKind::NONE:
    break;
  }
  return 0.0;
}

double feeAdjustedCost(double p, const FeeModel &fees) {
  return p + feePerUnit(p, fees);
}

double feeAdjustedImplied(double q, const FeeModel &fees) {
  return q - feePerUnit(q, fees);
}

double feeUsd(double p, double units, const FeeModel &fees) {
  double raw = feePerUnit(p, fees) * units;
  if (fees.kind == FeeKind::EXCHANGE_QUADRATIC)
    return std::ceil(raw * 100.0 - 1e-9) / 100.0;
  return raw;
}

double stakeForUnits(double price, PriceFormat format, double units) {
  return units * toImplied(price, format);
}

NormalizedQuote normalize(const Quote &quote, const FeeModel &fees) {
  NormalizedQuote nq;
  nq.quote = quote;
  nq.implied = toImplied(quote.price, quote.format);
  nq.fee_adjusted = quote.format == PriceFormat::PROBABILITY
                        ? feeAdjustedCost(nq.implied, fees)
                        : feeAdjustedImplied(nq.implied, fees);
  return nq;
}

double legOutlayUsd(const LegRecord &leg, const FeeModel &fees) {
  if (leg.filled_size <= 0.0)
    return 0.0;
  double price = leg.avg_price != 0.0 ? leg.avg_price : leg.plan.price;
  double p = toImplied(price, leg.plan.format);
  return leg.filled_size * p + feeUsd(p, leg.filled_size, fees);
}

} // namespace odds
} // namespace xarb
