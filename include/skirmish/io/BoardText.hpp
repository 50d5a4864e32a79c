#pragma once

#include "skirmish/combat/CombatState.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace skirmish::io {

struct ParseOptions {
  int start_hp{combat::kDefaultStartHp};
  combat::AttackProfile attack{};
};

struct ParseError {
  enum class Code {
    EmptyInput,
    UnknownGlyph
  } code{};
  int line{0};   // 0-based line of the input text, skipped blank lines included
  int column{0}; // 0-based column
  char glyph{'\0'};
  std::string message;
};

// Map text: '#' wall, '.' floor, 'E'/'G' a unit standing on floor.
// Leading blank lines are skipped, so raw string fixtures may start with a
// newline. Rows may differ in length; missing cells count as wall.
[[nodiscard]] std::expected<combat::CombatState, ParseError>
parse_battle(std::string_view text, const ParseOptions& options = {});

// One row per line. Rows holding living units are followed by their roster,
// e.g. "#G.E#   G(200), E(131)".
[[nodiscard]] std::string render_board(const combat::CombatState& state);

// "E@(1,2) hp=197; G@(1,3) hp=200" for logs.
[[nodiscard]] std::string describe_units(const combat::CombatState& state);

} // namespace skirmish::io
