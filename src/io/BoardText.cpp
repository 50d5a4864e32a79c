#include "skirmish/io/BoardText.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace skirmish::io {

using combat::Coord;
using combat::Faction;
using combat::Unit;

namespace {

struct MapLines {
  std::vector<std::string_view> rows;
  int first_line{0}; // input line of rows[0]
};

[[nodiscard]] MapLines split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    const std::size_t nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    if (nl == std::string_view::npos) break;
    text.remove_prefix(nl + 1);
  }

  // Leading and trailing blank lines carry no tiles.
  const auto blank = [](std::string_view l) {
    return l.find_first_not_of(" \t") == std::string_view::npos;
  };
  MapLines out;
  const auto first = std::find_if_not(lines.begin(), lines.end(), blank);
  out.first_line = static_cast<int>(first - lines.begin());
  out.rows.assign(first, lines.end());
  while (!out.rows.empty() && blank(out.rows.back())) out.rows.pop_back();
  return out;
}

} // namespace

std::expected<combat::CombatState, ParseError>
parse_battle(std::string_view text, const ParseOptions& options) {
  const MapLines map = split_lines(text);
  const std::vector<std::string_view>& lines = map.rows;
  if (lines.empty()) {
    return std::unexpected(ParseError{ParseError::Code::EmptyInput, 0, 0, '\0', "map text is empty"});
  }

  std::size_t width = 0;
  for (const auto l : lines) width = std::max(width, l.size());

  auto board = std::make_shared<pf::Board>(static_cast<int>(lines.size()), static_cast<int>(width));
  std::vector<Unit> units;

  for (std::size_t row = 0; row < lines.size(); ++row) {
    const std::string_view line = lines[row];
    for (std::size_t col = 0; col < line.size(); ++col) {
      const char c = line[col];
      const Coord at{static_cast<int>(row), static_cast<int>(col)};

      if (c == '#') continue;
      if (c == '.') {
        board->set_floor(at, true);
        continue;
      }
      if (const auto side = combat::faction_from_glyph(c)) {
        board->set_floor(at, true);
        units.push_back(Unit{at, options.start_hp, *side});
        continue;
      }

      const int line_no = map.first_line + at.row;
      return std::unexpected(ParseError{
          ParseError::Code::UnknownGlyph, line_no, at.col, c,
          "unrecognized map character '" + std::string(1, c) + "' at line " + std::to_string(line_no + 1) +
              ", column " + std::to_string(col + 1)});
    }
  }

  // Row-major scan already yields reading order.
  return combat::CombatState(std::move(board), std::move(units), options.attack);
}

std::string render_board(const combat::CombatState& state) {
  const pf::Board& b = state.board();

  std::vector<const Unit*> by_tile(static_cast<std::size_t>(b.rows()) * static_cast<std::size_t>(b.cols()), nullptr);
  for (const Unit& u : state.units()) {
    if (u.alive()) by_tile[pf::to_id(u.position, b.cols())] = &u;
  }

  std::string out;
  for (int row = 0; row < b.rows(); ++row) {
    std::vector<const Unit*> roster;
    for (int col = 0; col < b.cols(); ++col) {
      const Coord at{row, col};
      const Unit* u = by_tile[pf::to_id(at, b.cols())];
      if (u) {
        out.push_back(combat::glyph(u->side));
        roster.push_back(u);
      } else {
        out.push_back(b.contains(at) ? '.' : '#');
      }
    }

    if (!roster.empty()) {
      out.append("   ");
      for (std::size_t i = 0; i < roster.size(); ++i) {
        if (i) out.append(", ");
        out.push_back(combat::glyph(roster[i]->side));
        out.append("(" + std::to_string(roster[i]->hit_points) + ")");
      }
    }
    out.push_back('\n');
  }
  return out;
}

std::string describe_units(const combat::CombatState& state) {
  std::string out;
  for (const Unit& u : state.units()) {
    if (!u.alive()) continue;
    if (!out.empty()) out.append("; ");
    out.push_back(combat::glyph(u.side));
    out.append("@(" + std::to_string(u.position.row) + "," + std::to_string(u.position.col) + ") hp=" +
               std::to_string(u.hit_points));
  }
  return out;
}

} // namespace skirmish::io
