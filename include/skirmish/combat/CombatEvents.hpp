#pragma once

#include "CombatTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace skirmish::combat {

enum class CombatEventType : std::uint8_t {
  Moved          = 0,
  Attacked       = 1,
  UnitDied       = 2,
  RoundCompleted = 3,
  BattleEnded    = 4
};

[[nodiscard]] constexpr std::string_view to_string(CombatEventType t) noexcept {
  switch (t) {
    case CombatEventType::Moved:          return "Moved";
    case CombatEventType::Attacked:       return "Attacked";
    case CombatEventType::UnitDied:       return "UnitDied";
    case CombatEventType::RoundCompleted: return "RoundCompleted";
    case CombatEventType::BattleEnded:    return "BattleEnded";
    default:                              return "Unknown";
  }
}

// One entry of a battle trajectory. Positions are copied in so the log stays
// meaningful after the unit list has been re-sorted.
struct CombatEvent {
  CombatEventType type{CombatEventType::Moved};
  int round{0};

  Faction source_side{Faction::Elf};
  Coord from{};
  Coord to{};

  // For attacks and deaths
  Coord target{};
  int damage{0};
  int target_hp_after{0};

  constexpr bool operator==(const CombatEvent&) const = default;
};

// Compact human-readable summary (for debug logs).
[[nodiscard]] inline std::string describe_event(const CombatEvent& e) {
  const auto at = [](Coord c) {
    return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
  };

  std::string out;
  out.reserve(96);

  out.append("r");
  out.append(std::to_string(e.round));
  out.push_back(' ');
  out.append(to_string(e.type));

  switch (e.type) {
    case CombatEventType::Moved:
      out.push_back(' ');
      out.push_back(glyph(e.source_side));
      out.append(at(e.from));
      out.append("->");
      out.append(at(e.to));
      break;
    case CombatEventType::Attacked:
    case CombatEventType::UnitDied:
      out.push_back(' ');
      out.push_back(glyph(e.source_side));
      out.append(at(e.from));
      out.append(" tgt=");
      out.append(at(e.target));
      out.append(" dmg=");
      out.append(std::to_string(e.damage));
      out.append(" hp=");
      out.append(std::to_string(e.target_hp_after));
      break;
    case CombatEventType::BattleEnded:
      out.append(" winner=");
      out.append(to_string(e.source_side));
      break;
    default:
      break;
  }
  return out;
}

} // namespace skirmish::combat
