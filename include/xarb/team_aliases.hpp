#pragma once
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace xarb {

// Maps the names venues use for a team (city short names like
// "Oklahoma City", franchise codes like "OKC", nicknames) to one canonical
// full name. Cities shared by two franchises resolve per sport.
class TeamAliases {
public:
  static const TeamAliases &instance();

  // Canonical lowercase full name, or nullopt if the name is unknown.
  std::optional<std::string> resolve(const std::string &name,
                                     const std::string &sport) const;

  // Canonical name if known, else the normalized input.
  std::string canonical(const std::string &name,
                        const std::string &sport) const;

  // lowercase, punctuation dropped, whitespace collapsed
  static std::string normalize(const std::string &s);

private:
  TeamAliases();
  void add(const std::string &sport, const std::string &full,
           std::initializer_list<const char *> aliases);

  // sport key -> alias -> canonical name
  std::map<std::string, std::unordered_map<std::string, std::string>> by_sport_;
};

} // namespace xarb
