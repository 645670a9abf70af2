#pragma once
#include "xarb/common.hpp"
#include <string>
#include <vector>

namespace xarb {

// Read a JSON config file on top of the defaults. Unknown keys are ignored;
// a missing or malformed file throws ConfigurationError.
Config loadConfig(const std::string &path);

// Overlay values parsed from an already-loaded JSON string.
Config parseConfig(const std::string &json_text, Config base = Config{});

// Credentials come from the environment only.
void applyEnv(Config &cfg);

// Throws ConfigurationError on any invalid cap or threshold. Bet caps above
// hard_max_leg_usd are clamped, not rejected.
void validateConfig(Config &cfg);

// Odds venues licensed in a US state ("ny", "nj", ...). Empty if unknown.
std::vector<std::string> bookmakersForState(const std::string &state);

// Default venue entry for a sportsbook (read-only, proportional vig).
VenueConfig defaultOddsVenue(const std::string &id);

} // namespace xarb
