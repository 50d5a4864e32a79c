#include "skirmish/combat/CombatState.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace skirmish::combat {

namespace {
[[nodiscard]] std::string where(Coord c) {
  return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}
} // namespace

CombatState::CombatState(std::shared_ptr<const pf::Board> board, std::vector<Unit> units,
                         AttackProfile attack)
    : board_(std::move(board)), units_(std::move(units)), attack_(attack) {
  if (!board_) throw std::invalid_argument("CombatState: null board");

  occupied_.assign(static_cast<std::size_t>(board_->rows()) * static_cast<std::size_t>(board_->cols()), 0);
  for (const Unit& u : units_) {
    if (!u.alive()) continue;
    if (!board_->contains(u.position))
      throw std::invalid_argument("CombatState: unit placed off the floor at " + where(u.position));
    pf::u8& slot = occupied_[tile_index(u.position)];
    if (slot != 0)
      throw std::invalid_argument("CombatState: two units share " + where(u.position));
    slot = 1;
  }
}

std::size_t CombatState::tile_index(Coord c) const noexcept {
  return static_cast<std::size_t>(pf::to_id(c, board_->cols()));
}

bool CombatState::is_occupied(Coord c) const noexcept {
  if (!board_->bounds().contains(c)) return false;
  return occupied_[tile_index(c)] != 0;
}

std::vector<Coord> CombatState::occupied_tiles() const {
  std::vector<Coord> out;
  const int cols = board_->cols();
  for (std::size_t i = 0; i < occupied_.size(); ++i) {
    if (occupied_[i] != 0) out.push_back(pf::from_id(static_cast<pf::NodeId>(i), cols));
  }
  return out; // row-major scan, so already in reading order
}

std::size_t CombatState::unit_at(Coord c) const noexcept {
  if (!is_occupied(c)) return kNoUnit;
  for (std::size_t i = 0; i < units_.size(); ++i) {
    if (units_[i].alive() && units_[i].position == c) return i;
  }
  return kNoUnit;
}

void CombatState::move_unit(std::size_t index, Coord to) {
  Unit& u = units_.at(index);
  if (!u.alive()) throw std::logic_error("move_unit: unit at " + where(u.position) + " is dead");
  if (u.position == to) return;
  if (!board_->contains(to) || is_occupied(to))
    throw std::logic_error("move_unit: destination " + where(to) + " is not free");

  occupied_[tile_index(u.position)] = 0;
  u.position = to;
  occupied_[tile_index(to)] = 1;
}

bool CombatState::apply_damage(std::size_t index, int amount) {
  Unit& u = units_.at(index);
  if (!u.alive())
    throw std::logic_error("apply_damage: target at " + where(u.position) + " is already dead");

  u.hit_points -= amount;
  if (u.alive()) return false;

  occupied_[tile_index(u.position)] = 0;
  return true;
}

void CombatState::sort_reading_order() {
  std::stable_sort(units_.begin(), units_.end(), [](const Unit& a, const Unit& b) {
    return pf::reading_order_before(a.position, b.position);
  });
}

int CombatState::living_count(Faction f) const noexcept {
  return static_cast<int>(std::count_if(units_.begin(), units_.end(), [f](const Unit& u) {
    return u.side == f && u.alive();
  }));
}

int CombatState::deaths(Faction f) const noexcept {
  return static_cast<int>(std::count_if(units_.begin(), units_.end(), [f](const Unit& u) {
    return u.side == f && !u.alive();
  }));
}

int CombatState::remaining_hp() const noexcept {
  int hp = 0;
  for (const Unit& u : units_) {
    if (u.alive()) hp += u.hit_points;
  }
  return hp;
}

std::vector<Unit> CombatState::living_units() const {
  std::vector<Unit> out;
  out.reserve(units_.size());
  std::copy_if(units_.begin(), units_.end(), std::back_inserter(out),
               [](const Unit& u) { return u.alive(); });
  return out;
}

bool CombatState::check_occupancy() const {
  std::vector<pf::u8> expected(occupied_.size(), 0);
  for (const Unit& u : units_) {
    if (u.alive()) expected[tile_index(u.position)] = 1;
  }
  return expected == occupied_;
}

} // namespace skirmish::combat
