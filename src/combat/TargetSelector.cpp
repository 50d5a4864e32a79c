#include "skirmish/combat/TargetSelector.hpp"

#include <optional>

namespace skirmish::combat {

namespace {

struct Candidate {
  int distance;
  Coord destination;
  Coord enemy;
  Coord step;
};

[[nodiscard]] bool candidate_before(const Candidate& a, const Candidate& b) noexcept {
  if (a.distance != b.distance) return a.distance < b.distance;
  if (a.destination != b.destination) return pf::reading_order_before(a.destination, b.destination);
  if (a.enemy != b.enemy) return pf::reading_order_before(a.enemy, b.enemy);
  return pf::reading_order_before(a.step, b.step);
}

} // namespace

MoveDecision TargetSelector::choose_move(const CombatState& state, std::size_t actor) {
  const Unit& me = state.unit(actor);
  const pf::Board& board = state.board();

  bool any_enemy = false;
  bool searched = false;
  std::optional<Candidate> best;

  for (const Unit& enemy : state.units()) {
    if (enemy.side == me.side || !enemy.alive()) continue;
    any_enemy = true;

    for (const Coord dest : pf::neighbors4(enemy.position)) {
      const bool open = (dest == me.position) || (board.contains(dest) && !state.is_occupied(dest));
      if (!open) continue;

      // One flood from the actor answers every candidate destination.
      if (!searched) {
        bfs_.search(me.position, state.occupancy());
        searched = true;
      }

      const auto route = bfs_.route_to(dest);
      if (!route) continue;

      const Candidate c{route->distance, dest, enemy.position, route->first_step};
      if (!best || candidate_before(c, *best)) best = c;
    }
  }

  MoveDecision d{};
  if (!any_enemy) {
    d.kind = MoveKind::NoEnemies;
    return d;
  }
  if (!best) {
    d.kind = MoveKind::Unreachable;
    return d;
  }

  d.kind = MoveKind::Advance;
  d.distance = best->distance;
  d.destination = best->destination;
  d.enemy = best->enemy;
  d.step = best->step;
  return d;
}

std::size_t TargetSelector::choose_attack_target(const CombatState& state, std::size_t actor) const {
  const Unit& me = state.unit(actor);

  std::size_t best = kNoUnit;
  for (const Coord c : pf::neighbors4(me.position)) {
    const std::size_t idx = state.unit_at(c);
    if (idx == kNoUnit) continue;

    const Unit& t = state.unit(idx);
    if (t.side == me.side) continue;

    if (best == kNoUnit) {
      best = idx;
      continue;
    }
    const Unit& b = state.unit(best);
    if (t.hit_points < b.hit_points ||
        (t.hit_points == b.hit_points && pf::reading_order_before(t.position, b.position))) {
      best = idx;
    }
  }
  return best;
}

} // namespace skirmish::combat
