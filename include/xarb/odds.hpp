#pragma once
#include "xarb/common.hpp"
#include <Eigen/Dense>

namespace xarb {

// Stateless conversions between odds representations, implied probability
// and per-venue fees.
namespace odds {

// |odds| >= 100; throws std::invalid_argument otherwise
double americanToImplied(double american);

// p in (0, 1); unrounded so the round trip is exact up to floating error
double impliedToAmerican(double p);
int impliedToAmericanRounded(double p);

double americanToDecimal(double american);
double decimalToImplied(double decimal);
double impliedToDecimal(double p);

double toImplied(double price, PriceFormat format);

// De-vig across complementary outcomes.
// Proportional: p_i / sum(p). Power: p_i^k with k such that sum = 1.
Eigen::VectorXd devigProportional(const Eigen::VectorXd &implied);
Eigen::VectorXd devigPower(const Eigen::VectorXd &implied, int max_iters = 50,
                           double tol = 1e-12);

// Venue fee per $1-payout unit at probability p (unrounded).
double feePerUnit(double p, const FeeModel &fees);

// Effective cost per unit of buying at probability price p.
double feeAdjustedCost(double p, const FeeModel &fees);

// Achievable probability of a line after the venue's cut. Fees always move
// both sides against us: costs go up, achievable probabilities go down.
double feeAdjustedImplied(double q, const FeeModel &fees);

// Fee in USD for `units` bought at p; exchange schedule rounds up to the cent.
double feeUsd(double p, double units, const FeeModel &fees);

// Dollars committed to a leg of `units` $1-payout units at `price`.
double stakeForUnits(double price, PriceFormat format, double units);

NormalizedQuote normalize(const Quote &quote, const FeeModel &fees);

// Dollars actually committed by a leg's fills, fees included.
double legOutlayUsd(const LegRecord &leg, const FeeModel &fees);

} // namespace odds
} // namespace xarb
