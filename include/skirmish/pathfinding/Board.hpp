#pragma once
#include "GridTypes.hpp"
#include <cstddef>
#include <vector>

namespace skirmish::pf {

// Static set of walkable tiles. Built once from the map text and never
// mutated during a battle; combat states share it through a const pointer.
class Board {
public:
    Board() = default;
    Board(int rows, int cols)
        : _b{rows, cols}, _floor(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), 0) {}

    [[nodiscard]] const Bounds& bounds() const noexcept { return _b; }
    [[nodiscard]] int rows() const noexcept { return _b.rows; }
    [[nodiscard]] int cols() const noexcept { return _b.cols; }

    // Only meant for construction; Board is handed out as const afterwards.
    void set_floor(Coord c, bool open) {
        if (!_b.contains(c)) return;
        const u8 v = open ? 1 : 0;
        u8& slot = _floor[to_id(c, _b.cols)];
        if (slot != v) _open_count += open ? 1 : -1;
        slot = v;
    }

    [[nodiscard]] bool contains(Coord c) const noexcept {
        return _b.contains(c) && _floor[to_id(c, _b.cols)] != 0;
    }

    [[nodiscard]] int open_count() const noexcept { return _open_count; }

private:
    Bounds _b{};
    std::vector<u8> _floor;
    int _open_count{0};
};

} // namespace skirmish::pf
