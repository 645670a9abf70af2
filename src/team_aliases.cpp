#include "xarb/team_aliases.hpp"
#include <cctype>

namespace xarb {

static const char *NBA = "basketball_nba";
static const char *NHL = "icehockey_nhl";
static const char *NFL = "americanfootball_nfl";

const TeamAliases &TeamAliases::instance() {
  static const TeamAliases aliases;
  return aliases;
}

std::string TeamAliases::normalize(const std::string &s) {
  std::string out;
  bool space = false;
  for (char c : s) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) {
      if (space && !out.empty())
        out += ' ';
      out += static_cast<char>(std::tolower(u));
      space = false;
    } else if (std::isspace(u) || c == '-' || c == '_') {
      space = true;
    }
    // '.', '\'' and the rest are dropped in place
  }
  return out;
}

void TeamAliases::add(const std::string &sport, const std::string &full,
                      std::initializer_list<const char *> aliases) {
  auto &table = by_sport_[sport];
  std::string canon = normalize(full);
  table[canon] = canon;
  for (const char *a : aliases)
    table[normalize(a)] = canon;
}

std::optional<std::string> TeamAliases::resolve(const std::string &name,
                                                const std::string &sport) const {
  std::string key = normalize(name);
  auto sit = by_sport_.find(sport);
  if (sit != by_sport_.end()) {
    auto it = sit->second.find(key);
    if (it != sit->second.end())
      return it->second;
    return std::nullopt;
  }
  // unknown sport: first table that knows the name
  for (const auto &[s, table] : by_sport_) {
    auto it = table.find(key);
    if (it != table.end())
      return it->second;
  }
  return std::nullopt;
}

std::string TeamAliases::canonical(const std::string &name,
                                   const std::string &sport) const {
  auto r = resolve(name, sport);
  return r ? *r : normalize(name);
}

TeamAliases::TeamAliases() {
  // ── NBA ────────────────────────────────────────────────────────────
  add(NBA, "Atlanta Hawks", {"atlanta", "atl", "hawks"});
  add(NBA, "Boston Celtics", {"boston", "bos", "celtics"});
  add(NBA, "Brooklyn Nets", {"brooklyn", "bkn", "nets"});
  add(NBA, "Charlotte Hornets", {"charlotte", "cha", "hornets"});
  add(NBA, "Chicago Bulls", {"chicago", "chi", "bulls"});
  add(NBA, "Cleveland Cavaliers", {"cleveland", "cle", "cavaliers", "cavs"});
  add(NBA, "Dallas Mavericks", {"dallas", "dal", "mavericks", "mavs"});
  add(NBA, "Denver Nuggets", {"denver", "den", "nuggets"});
  add(NBA, "Detroit Pistons", {"detroit", "det", "pistons"});
  add(NBA, "Golden State Warriors", {"golden state", "gsw", "gs", "warriors"});
  add(NBA, "Houston Rockets", {"houston", "hou", "rockets"});
  add(NBA, "Indiana Pacers", {"indiana", "ind", "pacers"});
  add(NBA, "Los Angeles Clippers",
      {"los angeles c", "la clippers", "lac", "clippers"});
  add(NBA, "Los Angeles Lakers",
      {"los angeles l", "los angeles", "la lakers", "lal", "lakers"});
  add(NBA, "Memphis Grizzlies", {"memphis", "mem", "grizzlies"});
  add(NBA, "Miami Heat", {"miami", "mia", "heat"});
  add(NBA, "Milwaukee Bucks", {"milwaukee", "mil", "bucks"});
  add(NBA, "Minnesota Timberwolves", {"minnesota", "min", "timberwolves"});
  add(NBA, "New Orleans Pelicans", {"new orleans", "nop", "no", "pelicans"});
  add(NBA, "New York Knicks", {"new york", "nyk", "ny", "knicks"});
  add(NBA, "Oklahoma City Thunder", {"oklahoma city", "okc", "thunder"});
  add(NBA, "Orlando Magic", {"orlando", "orl", "magic"});
  add(NBA, "Philadelphia 76ers", {"philadelphia", "phi", "76ers", "sixers"});
  add(NBA, "Phoenix Suns", {"phoenix", "phx", "suns"});
  add(NBA, "Portland Trail Blazers",
      {"portland", "por", "trail blazers", "blazers"});
  add(NBA, "Sacramento Kings", {"sacramento", "sac", "kings"});
  add(NBA, "San Antonio Spurs", {"san antonio", "sas", "sa", "spurs"});
  add(NBA, "Toronto Raptors", {"toronto", "tor", "raptors"});
  add(NBA, "Utah Jazz", {"utah", "uta", "jazz"});
  add(NBA, "Washington Wizards", {"washington", "was", "wsh", "wizards"});

  // ── NHL ────────────────────────────────────────────────────────────
  add(NHL, "Anaheim Ducks", {"anaheim", "ana", "ducks"});
  add(NHL, "Boston Bruins", {"boston", "bos", "bruins"});
  add(NHL, "Buffalo Sabres", {"buffalo", "buf", "sabres"});
  add(NHL, "Calgary Flames", {"calgary", "cgy", "flames"});
  add(NHL, "Carolina Hurricanes", {"carolina", "car", "hurricanes"});
  add(NHL, "Chicago Blackhawks", {"chicago", "chi", "blackhawks"});
  add(NHL, "Colorado Avalanche", {"colorado", "col", "avalanche"});
  add(NHL, "Columbus Blue Jackets", {"columbus", "cbj", "blue jackets"});
  add(NHL, "Dallas Stars", {"dallas", "dal", "stars"});
  add(NHL, "Detroit Red Wings", {"detroit", "det", "red wings"});
  add(NHL, "Edmonton Oilers", {"edmonton", "edm", "oilers"});
  add(NHL, "Florida Panthers", {"florida", "fla", "panthers"});
  add(NHL, "Los Angeles Kings", {"los angeles", "la", "lak", "kings"});
  add(NHL, "Minnesota Wild", {"minnesota", "min", "wild"});
  add(NHL, "Montreal Canadiens", {"montreal", "mtl", "canadiens"});
  add(NHL, "Nashville Predators", {"nashville", "nsh", "predators"});
  add(NHL, "New Jersey Devils", {"new jersey", "nj", "njd", "devils"});
  add(NHL, "New York Islanders", {"ny islanders", "nyi", "islanders"});
  add(NHL, "New York Rangers", {"ny rangers", "nyr", "rangers"});
  add(NHL, "Ottawa Senators", {"ottawa", "ott", "senators"});
  add(NHL, "Philadelphia Flyers", {"philadelphia", "phi", "flyers"});
  add(NHL, "Pittsburgh Penguins", {"pittsburgh", "pit", "penguins"});
  add(NHL, "San Jose Sharks", {"san jose", "sj", "sjs", "sharks"});
  add(NHL, "Seattle Kraken", {"seattle", "sea", "kraken"});
  add(NHL, "St. Louis Blues", {"st. louis", "st louis", "stl", "blues"});
  add(NHL, "Tampa Bay Lightning", {"tampa bay", "tb", "tbl", "lightning"});
  add(NHL, "Toronto Maple Leafs", {"toronto", "tor", "maple leafs"});
  add(NHL, "Utah Mammoth", {"utah", "uta", "mammoth"});
  add(NHL, "Vancouver Canucks", {"vancouver", "van", "canucks"});
  add(NHL, "Vegas Golden Knights", {"vegas", "vgk", "golden knights"});
  add(NHL, "Washington Capitals", {"washington", "wsh", "capitals"});
  add(NHL, "Winnipeg Jets", {"winnipeg", "wpg", "jets"});

  // ── NFL ────────────────────────────────────────────────────────────
  add(NFL, "Arizona Cardinals", {"arizona", "ari", "cardinals"});
  add(NFL, "Atlanta Falcons", {"atlanta", "atl", "falcons"});
  add(NFL, "Baltimore Ravens", {"baltimore", "bal", "ravens"});
  add(NFL, "Buffalo Bills", {"buffalo", "buf", "bills"});
  add(NFL, "Carolina Panthers", {"carolina", "car", "panthers"});
  add(NFL, "Chicago Bears", {"chicago", "chi", "bears"});
  add(NFL, "Cincinnati Bengals", {"cincinnati", "cin", "bengals"});
  add(NFL, "Cleveland Browns", {"cleveland", "cle", "browns"});
  add(NFL, "Dallas Cowboys", {"dallas", "dal", "cowboys"});
  add(NFL, "Denver Broncos", {"denver", "den", "broncos"});
  add(NFL, "Detroit Lions", {"detroit", "det", "lions"});
  add(NFL, "Green Bay Packers", {"green bay", "gb", "packers"});
  add(NFL, "Houston Texans", {"houston", "hou", "texans"});
  add(NFL, "Indianapolis Colts", {"indianapolis", "ind", "colts"});
  add(NFL, "Jacksonville Jaguars", {"jacksonville", "jax", "jaguars"});
  add(NFL, "Kansas City Chiefs", {"kansas city", "kc", "chiefs"});
  add(NFL, "Las Vegas Raiders", {"las vegas", "lv", "raiders"});
  add(NFL, "Los Angeles Chargers",
      {"los angeles c", "la chargers", "lac", "chargers"});
  add(NFL, "Los Angeles Rams", {"los angeles r", "la rams", "lar", "rams"});
  add(NFL, "Miami Dolphins", {"miami", "mia", "dolphins"});
  add(NFL, "Minnesota Vikings", {"minnesota", "min", "vikings"});
  add(NFL, "New England Patriots", {"new england", "ne", "patriots"});
  add(NFL, "New Orleans Saints", {"new orleans", "no", "saints"});
  add(NFL, "New York Giants", {"ny giants", "new york g", "nyg", "giants"});
  add(NFL, "New York Jets", {"ny jets", "new york j", "nyj", "jets"});
  add(NFL, "Philadelphia Eagles", {"philadelphia", "phi", "eagles"});
  add(NFL, "Pittsburgh Steelers", {"pittsburgh", "pit", "steelers"});
  add(NFL, "San Francisco 49ers", {"san francisco", "sf", "49ers", "niners"});
  add(NFL, "Seattle Seahawks", {"seattle", "sea", "seahawks"});
  add(NFL, "Tampa Bay Buccaneers", {"tampa bay", "tb", "buccaneers", "bucs"});
  add(NFL, "Tennessee Titans", {"tennessee", "ten", "titans"});
  add(NFL, "Washington Commanders", {"washington", "was", "commanders"});
}

} // namespace xarb
