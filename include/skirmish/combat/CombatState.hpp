#pragma once

#include "CombatTypes.hpp"
#include "skirmish/pathfinding/Board.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace skirmish::combat {

// Mutable per-battle state: the unit list plus an occupancy mask derived from
// it. Units are never removed; a dead unit keeps its slot and last position.
//
// Invariant: a tile is marked occupied exactly when a living unit stands on
// it. Every mutator below restores this before returning.
//
// Copying is cheap and is how a battle is replayed from its initial layout:
// the board is shared, units and occupancy are duplicated.
class CombatState final {
public:
  CombatState(std::shared_ptr<const pf::Board> board, std::vector<Unit> units,
              AttackProfile attack = {});

  [[nodiscard]] const pf::Board& board() const noexcept { return *board_; }

  [[nodiscard]] std::size_t size() const noexcept { return units_.size(); }
  [[nodiscard]] std::span<const Unit> units() const noexcept { return units_; }
  [[nodiscard]] const Unit& unit(std::size_t index) const { return units_.at(index); }

  [[nodiscard]] bool is_occupied(Coord c) const noexcept;
  [[nodiscard]] std::span<const pf::u8> occupancy() const noexcept { return occupied_; }
  [[nodiscard]] std::vector<Coord> occupied_tiles() const;

  // Index of the living unit standing on `c`, if any.
  [[nodiscard]] std::size_t unit_at(Coord c) const noexcept;

  [[nodiscard]] int attack_power(Faction f) const noexcept { return attack_.of(f); }
  void set_attack_power(Faction f, int power) noexcept { attack_.set(f, power); }

  // Relocates a living unit onto an open, unoccupied tile.
  // Throws std::logic_error on a dead unit or a blocked destination.
  void move_unit(std::size_t index, Coord to);

  // Subtracts `amount` from a living unit. Returns true if the hit killed it,
  // in which case its tile is released immediately.
  // Throws std::logic_error if the unit is already dead.
  bool apply_damage(std::size_t index, int amount);

  // Stable re-sort of the unit list into reading order of position.
  void sort_reading_order();

  [[nodiscard]] int living_count(Faction f) const noexcept;
  [[nodiscard]] int deaths(Faction f) const noexcept;
  [[nodiscard]] int remaining_hp() const noexcept;
  [[nodiscard]] std::vector<Unit> living_units() const;

  // Rebuilds occupancy from scratch and reports whether it already matched.
  bool check_occupancy() const;

private:
  std::shared_ptr<const pf::Board> board_;
  std::vector<Unit> units_;
  std::vector<pf::u8> occupied_;
  AttackProfile attack_{};

  [[nodiscard]] std::size_t tile_index(Coord c) const noexcept;
};

} // namespace skirmish::combat
