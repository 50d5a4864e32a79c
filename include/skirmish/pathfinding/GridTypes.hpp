#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <limits>

namespace skirmish::pf {

using u8  = std::uint8_t;
using u32 = std::uint32_t;

// Tile coordinate. Members are ordered (row, col) so the defaulted comparison
// is reading order: top to bottom, then left to right.
struct Coord {
    int row{}, col{};
    constexpr bool operator==(const Coord&) const = default;
    constexpr auto operator<=>(const Coord&) const = default;
};

// The one ordering used for every tie-break (destinations, first steps,
// attack targets).
[[nodiscard]] constexpr bool reading_order_before(Coord a, Coord b) noexcept {
    if (a.row != b.row) return a.row < b.row;
    return a.col < b.col;
}

struct ReadingOrder {
    [[nodiscard]] constexpr bool operator()(Coord a, Coord b) const noexcept {
        return reading_order_before(a, b);
    }
};

// Orthogonal neighbours, already in reading order: up, left, right, down.
[[nodiscard]] constexpr std::array<Coord, 4> neighbors4(Coord c) noexcept {
    return {{ {c.row - 1, c.col}, {c.row, c.col - 1}, {c.row, c.col + 1}, {c.row + 1, c.col} }};
}

struct Bounds {
    int rows{}, cols{};
    [[nodiscard]] constexpr bool contains(Coord c) const noexcept {
        return c.row >= 0 && c.col >= 0 && c.row < rows && c.col < cols;
    }
};

using NodeId = u32;
constexpr NodeId kInvalid = std::numeric_limits<NodeId>::max();

// Encode/decode Coord <-> NodeId (row-major)
inline NodeId to_id(Coord c, int cols) { return static_cast<NodeId>(c.row * cols + c.col); }
inline Coord  from_id(NodeId id, int cols) { return { int(id / u32(cols)), int(id % u32(cols)) }; }

} // namespace skirmish::pf
