#include "skirmish/combat/PowerSearch.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace skirmish::combat {

std::expected<PowerSearchResult, SearchError>
search_minimal_power(const CombatState& initial, const PowerSearchOptions& options) {
  if (options.start_power < 1 || options.max_power < options.start_power) {
    return std::unexpected(SearchError{
        SearchError::Code::InvalidOptions, options.start_power,
        "invalid power range [" + std::to_string(options.start_power) + ", " +
            std::to_string(options.max_power) + "]"});
  }

  const Faction guarded = options.protected_faction;
  int attempts = 0;

  for (int power = options.start_power; power <= options.max_power; ++power) {
    CombatState attempt = initial;
    attempt.set_attack_power(guarded, power);
    ++attempts;

    auto outcome = run_to_completion(attempt, options.limits);
    if (!outcome) {
      return std::unexpected(SearchError{SearchError::Code::RoundLimit, power,
                                         "power " + std::to_string(power) + ": " + outcome.error().message});
    }

    const int lost = attempt.deaths(guarded);
    spdlog::debug("{} win with {} hp and {} {} died after {} rounds at {} power {}.",
                  outcome->winner ? plural(*outcome->winner) : "Nobody", outcome->remaining_hp, lost,
                  plural(guarded), outcome->rounds, to_string(guarded), power);

    if (lost == 0) {
      return PowerSearchResult{outcome->rounds, outcome->remaining_hp, power, attempts, std::move(attempt)};
    }
  }

  return std::unexpected(SearchError{
      SearchError::Code::NoSolution, options.max_power,
      "no attack power up to " + std::to_string(options.max_power) + " keeps every " +
          std::string(to_string(guarded)) + " alive"});
}

} // namespace skirmish::combat
