#include "skirmish/combat/RoundEngine.hpp"

#include "skirmish/io/BoardText.hpp"

#include <spdlog/spdlog.h>

namespace skirmish::combat {

RoundEngine::RoundEngine(CombatState& state, RoundEngineConfig config)
    : state_(state), config_(config), selector_(state.board()) {}

void RoundEngine::push_event(const CombatEvent& e) {
  spdlog::trace("{}", describe_event(e));
  if (config_.record_events) events_.push_back(e);
}

RoundResult RoundEngine::play_round() {
  const int round = completed_rounds_ + 1;

  if (state_.living_count(Faction::Elf) == 0 && state_.living_count(Faction::Goblin) == 0) {
    return RoundResult{RoundState::Ended, false, std::nullopt};
  }

  for (std::size_t i = 0; i < state_.size(); ++i) {
    const Unit& u = state_.unit(i);
    if (!u.alive()) continue;

    const MoveDecision d = selector_.choose_move(state_, i);
    if (d.kind == MoveKind::NoEnemies) {
      CombatEvent e{};
      e.type = CombatEventType::BattleEnded;
      e.round = round;
      e.source_side = u.side;
      e.from = u.position;
      push_event(e);
      return RoundResult{RoundState::Ended, false, u.side};
    }
    if (d.kind == MoveKind::Unreachable) continue;

    if (d.step != u.position) {
      CombatEvent e{};
      e.type = CombatEventType::Moved;
      e.round = round;
      e.source_side = u.side;
      e.from = u.position;
      e.to = d.step;
      state_.move_unit(i, d.step);
      push_event(e);
    }

    take_turn(i);
  }

  state_.sort_reading_order();
  completed_rounds_ = round;

  CombatEvent done{};
  done.type = CombatEventType::RoundCompleted;
  done.round = round;
  push_event(done);

  if (spdlog::default_logger_raw()->should_log(spdlog::level::debug))
    spdlog::debug("Round {} done: {}", round, io::describe_units(state_));

  const bool elves_left = state_.living_count(Faction::Elf) > 0;
  const bool goblins_left = state_.living_count(Faction::Goblin) > 0;
  if (elves_left && goblins_left) return RoundResult{};

  RoundResult r{RoundState::Ended, true, std::nullopt};
  if (elves_left) r.winner = Faction::Elf;
  if (goblins_left) r.winner = Faction::Goblin;
  return r;
}

void RoundEngine::take_turn(std::size_t index) {
  const std::size_t target = selector_.choose_attack_target(state_, index);
  if (target == kNoUnit) return;

  const Unit& attacker = state_.unit(index);
  const int damage = state_.attack_power(attacker.side);
  const bool died = state_.apply_damage(target, damage);

  const Unit& victim = state_.unit(target);
  CombatEvent e{};
  e.type = CombatEventType::Attacked;
  e.round = completed_rounds_ + 1;
  e.source_side = attacker.side;
  e.from = attacker.position;
  e.target = victim.position;
  e.damage = damage;
  e.target_hp_after = victim.hit_points;
  push_event(e);

  if (died) {
    e.type = CombatEventType::UnitDied;
    push_event(e);
  }
}

std::expected<BattleOutcome, BattleError>
run_to_completion(CombatState& state, const BattleLimits& limits, std::vector<CombatEvent>* trajectory) {
  RoundEngine engine(state, RoundEngineConfig{trajectory != nullptr});

  for (;;) {
    const RoundResult r = engine.play_round();
    if (r.state == RoundState::Ended) {
      if (trajectory) trajectory->insert(trajectory->end(), engine.events().begin(), engine.events().end());

      BattleOutcome out{};
      out.rounds = engine.completed_rounds();
      out.remaining_hp = state.remaining_hp();
      out.winner = r.winner;
      return out;
    }

    if (limits.max_rounds > 0 && engine.completed_rounds() >= limits.max_rounds) {
      if (trajectory) trajectory->insert(trajectory->end(), engine.events().begin(), engine.events().end());
      return std::unexpected(BattleError{
          BattleError::Code::RoundLimit, engine.completed_rounds(),
          "battle still undecided after " + std::to_string(engine.completed_rounds()) + " rounds"});
    }
  }
}

} // namespace skirmish::combat
