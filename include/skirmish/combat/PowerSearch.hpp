#pragma once

#include "CombatState.hpp"
#include "RoundEngine.hpp"

#include <expected>
#include <string>

namespace skirmish::combat {

struct PowerSearchOptions {
  Faction protected_faction{Faction::Elf};

  // First power tried. Defaults to one above the stock power.
  int start_power{kDefaultAttackPower + 1};

  // Safety bound: the search gives up after trying this power.
  int max_power{200};

  BattleLimits limits{};
};

struct PowerSearchResult {
  int rounds{0};
  int remaining_hp{0};
  int power{0};
  int attempts{0};
  CombatState final_state;

  [[nodiscard]] long long score() const noexcept {
    return static_cast<long long>(rounds) * remaining_hp;
  }
};

struct SearchError {
  enum class Code {
    InvalidOptions,
    NoSolution,
    RoundLimit
  } code{};
  int last_power{0};
  std::string message;
};

// Smallest attack power for the protected faction that wins the battle with
// no losses. Every attempt replays a fresh copy of `initial`; powers are
// tried one by one upward because fewer deaths at higher power is only
// observed, not guaranteed.
[[nodiscard]] std::expected<PowerSearchResult, SearchError>
search_minimal_power(const CombatState& initial, const PowerSearchOptions& options = {});

} // namespace skirmish::combat
