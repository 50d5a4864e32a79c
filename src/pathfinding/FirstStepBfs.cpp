#include "skirmish/pathfinding/FirstStepBfs.hpp"

#include <algorithm>

namespace skirmish::pf {

namespace {

struct FrontierNode {
    Coord first;
    Coord at;
};

[[nodiscard]] bool expand_before(const FrontierNode& a, const FrontierNode& b) noexcept {
    if (a.first != b.first) return reading_order_before(a.first, b.first);
    return reading_order_before(a.at, b.at);
}

} // namespace

void FirstStepBfs::search(Coord origin, std::span<const u8> blocked) {
    const int cols = _m.cols();
    _cells.assign(static_cast<std::size_t>(_m.rows()) * static_cast<std::size_t>(cols), Cell{});
    if (!_m.bounds().contains(origin)) return;

    const auto is_blocked = [&](NodeId id) {
        return id < blocked.size() && blocked[id] != 0;
    };

    const NodeId oid = to_id(origin, cols);
    _cells[oid] = Cell{0, oid};

    std::vector<FrontierNode> layer{ FrontierNode{origin, origin} };
    std::vector<FrontierNode> next;

    for (int depth = 0; !layer.empty(); ++depth) {
        std::sort(layer.begin(), layer.end(), expand_before);
        next.clear();

        for (const FrontierNode& node : layer) {
            for (const Coord n : neighbors4(node.at)) {
                if (!_m.contains(n)) continue;
                const NodeId nid = to_id(n, cols);
                if (is_blocked(nid) || _cells[nid].dist >= 0) continue;

                const Coord first = (depth == 0) ? n : node.first;
                _cells[nid] = Cell{depth + 1, to_id(first, cols)};
                next.push_back(FrontierNode{first, n});
            }
        }
        layer.swap(next);
    }
}

std::optional<Route> FirstStepBfs::route_to(Coord dest) const {
    if (!_m.bounds().contains(dest) || _cells.empty()) return std::nullopt;
    const Cell& c = _cells[to_id(dest, _m.cols())];
    if (c.dist < 0) return std::nullopt;
    return Route{c.dist, from_id(c.first, _m.cols())};
}

} // namespace skirmish::pf
