#pragma once

#include "CombatEvents.hpp"
#include "CombatState.hpp"
#include "TargetSelector.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace skirmish::combat {

enum class RoundState : std::uint8_t { Continuing = 0, Ended = 1 };

struct RoundResult {
  RoundState state{RoundState::Continuing};

  // False when the battle ended part-way through the pass because an acting
  // unit found no enemies. Moves and attacks made before that point stand,
  // but the round does not count.
  bool completed{true};

  // Set when state == Ended and a faction is left standing.
  std::optional<Faction> winner{};
};

struct RoundEngineConfig {
  bool record_events{true};
};

// Executes rounds on a CombatState in place. Each living unit, in the order
// the list had at the end of the previous round, moves one step toward its
// chosen enemy and then attacks whoever is adjacent.
class RoundEngine final {
public:
  explicit RoundEngine(CombatState& state, RoundEngineConfig config = {});

  RoundResult play_round();

  [[nodiscard]] int completed_rounds() const noexcept { return completed_rounds_; }

  [[nodiscard]] std::span<const CombatEvent> events() const noexcept { return events_; }

private:
  CombatState& state_;
  RoundEngineConfig config_{};
  TargetSelector selector_;
  int completed_rounds_{0};
  std::vector<CombatEvent> events_{};

  void take_turn(std::size_t index);
  void push_event(const CombatEvent& e);
};

// ----------------------------------------------------------------------------
// Whole battle
// ----------------------------------------------------------------------------
struct BattleLimits {
  int max_rounds{0}; // 0 = unbounded
};

struct BattleOutcome {
  int rounds{0};
  int remaining_hp{0};
  std::optional<Faction> winner{};

  [[nodiscard]] long long score() const noexcept {
    return static_cast<long long>(rounds) * remaining_hp;
  }
};

struct BattleError {
  enum class Code {
    RoundLimit
  } code{};
  int rounds{0};
  std::string message;
};

// Plays rounds until one faction is gone. Only fully completed rounds are
// counted. If `trajectory` is given the event log is appended to it.
[[nodiscard]] std::expected<BattleOutcome, BattleError>
run_to_completion(CombatState& state, const BattleLimits& limits = {},
                  std::vector<CombatEvent>* trajectory = nullptr);

} // namespace skirmish::combat
