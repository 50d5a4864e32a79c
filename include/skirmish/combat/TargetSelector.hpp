#pragma once

#include "CombatState.hpp"
#include "skirmish/pathfinding/FirstStepBfs.hpp"

#include <cstddef>
#include <cstdint>

namespace skirmish::combat {

enum class MoveKind : std::uint8_t {
  NoEnemies   = 0, // nothing left to fight: the battle is over
  Unreachable = 1, // enemies exist but no open tile next to them can be reached
  Advance     = 2  // `step` is the tile to occupy (equals the current tile when in range)
};

struct MoveDecision {
  MoveKind kind{MoveKind::Unreachable};
  int distance{0};
  Coord destination{}; // open tile next to the chosen enemy
  Coord enemy{};
  Coord step{};
};

// Decides where an acting unit walks and whom it hits. Holds a reusable
// flood-fill buffer, so one selector serves a whole battle.
class TargetSelector final {
public:
  explicit TargetSelector(const pf::Board& board) : bfs_(board) {}

  // Nearest reachable tile adjacent to a living enemy, ties broken by
  // reading order of that tile, then of the enemy, then of the first step.
  [[nodiscard]] MoveDecision choose_move(const CombatState& state, std::size_t actor);

  // Adjacent living enemy with the fewest hit points, ties broken by reading
  // order. kNoUnit when nobody is in reach.
  [[nodiscard]] std::size_t choose_attack_target(const CombatState& state, std::size_t actor) const;

private:
  pf::FirstStepBfs bfs_;
};

} // namespace skirmish::combat
