#pragma once
#include "Board.hpp"
#include <optional>
#include <span>
#include <vector>

namespace skirmish::pf {

// Length of the shortest walk to a tile plus the first step of the
// reading-order-preferred walk of that length.
struct Route {
    int   distance{};
    Coord first_step{};
    constexpr bool operator==(const Route&) const = default;
};

// Breadth-first flood from a single origin over open, unblocked tiles.
//
// Layers are expanded in (first step, tile) reading order, and a tile is
// claimed by the first expansion that reaches it. That makes the recorded
// first step for every tile the smallest one among all shortest walks, the
// same answer a best-first search ordered by (steps, first step, tile) gives.
//
// `blocked` is a row-major mask over the board (non-zero = occupied). The
// origin itself is never treated as blocked.
class FirstStepBfs {
public:
    explicit FirstStepBfs(const Board& board) : _m(board) {}

    void search(Coord origin, std::span<const u8> blocked);

    // nullopt when `dest` was not reached by the last search.
    [[nodiscard]] std::optional<Route> route_to(Coord dest) const;

private:
    struct Cell {
        int    dist{-1};
        NodeId first{kInvalid};
    };

    const Board& _m;
    std::vector<Cell> _cells;
};

} // namespace skirmish::pf
