#pragma once

#include "skirmish/pathfinding/GridTypes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace skirmish::combat {

using pf::Coord;

// ----------------------------------------------------------------------------
// Factions
// ----------------------------------------------------------------------------
enum class Faction : std::uint8_t {
  Elf    = 0, // attack power is configurable (protected in the power search)
  Goblin = 1, // attack power fixed
  Count
};

inline constexpr std::size_t kFactionCount = static_cast<std::size_t>(Faction::Count);

inline constexpr int kDefaultStartHp = 200;
inline constexpr int kDefaultAttackPower = 3;

[[nodiscard]] constexpr std::string_view to_string(Faction f) noexcept {
  switch (f) {
    case Faction::Elf:    return "Elf";
    case Faction::Goblin: return "Goblin";
    default:              return "Unknown";
  }
}

// Plural form used in result lines ("Goblins win after ...").
[[nodiscard]] constexpr std::string_view plural(Faction f) noexcept {
  switch (f) {
    case Faction::Elf:    return "Elves";
    case Faction::Goblin: return "Goblins";
    default:              return "Nobody";
  }
}

[[nodiscard]] constexpr char glyph(Faction f) noexcept {
  return f == Faction::Elf ? 'E' : 'G';
}

[[nodiscard]] constexpr std::optional<Faction> faction_from_glyph(char c) noexcept {
  switch (c) {
    case 'E': return Faction::Elf;
    case 'G': return Faction::Goblin;
    default:  return std::nullopt;
  }
}

// ----------------------------------------------------------------------------
// Units
// ----------------------------------------------------------------------------
inline constexpr std::size_t kNoUnit = static_cast<std::size_t>(-1);

struct Unit {
  Coord position{};
  int hit_points{kDefaultStartHp};
  Faction side{Faction::Elf};

  [[nodiscard]] bool alive() const noexcept { return hit_points > 0; }

  constexpr bool operator==(const Unit&) const = default;
};

// Flat per-faction damage.
struct AttackProfile {
  std::array<int, kFactionCount> power{kDefaultAttackPower, kDefaultAttackPower};

  [[nodiscard]] int of(Faction f) const noexcept { return power[static_cast<std::size_t>(f)]; }
  void set(Faction f, int p) noexcept { power[static_cast<std::size_t>(f)] = p; }
};

} // namespace skirmish::combat
