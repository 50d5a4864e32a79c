#include <doctest/doctest.h>
#include "skirmish/pathfinding/FirstStepBfs.hpp"

#include <vector>

using namespace skirmish::pf;

namespace {

Board OpenRoom(int rows, int cols) {
    Board b(rows, cols);
    for (int r = 0; r < rows; ++r)
        for (int c = 0; c < cols; ++c)
            b.set_floor({r, c}, true);
    return b;
}

std::vector<u8> NoBlocks(const Board& b) {
    return std::vector<u8>(static_cast<size_t>(b.rows() * b.cols()), 0);
}

} // namespace

TEST_CASE("ReadingOrder/RowBeforeColumn") {
    CHECK(reading_order_before({0, 5}, {1, 0}));
    CHECK(reading_order_before({2, 1}, {2, 3}));
    CHECK_FALSE(reading_order_before({3, 0}, {2, 9}));
    CHECK_FALSE(reading_order_before({1, 1}, {1, 1}));

    const auto n = neighbors4({4, 4});
    for (size_t i = 1; i < n.size(); ++i)
        CHECK(reading_order_before(n[i - 1], n[i]));
}

TEST_CASE("FirstStepBfs/TiedFirstStepsPreferReadingOrder") {
    const Board b = OpenRoom(5, 5);
    const auto blocked = NoBlocks(b);

    FirstStepBfs bfs(b);
    bfs.search({2, 2}, blocked);

    // Up beats left, right beats down, up beats right, left beats down.
    CHECK(bfs.route_to({0, 0}) == Route{4, {1, 2}});
    CHECK(bfs.route_to({4, 4}) == Route{4, {2, 3}});
    CHECK(bfs.route_to({0, 4}) == Route{4, {1, 2}});
    CHECK(bfs.route_to({4, 0}) == Route{4, {2, 1}});

    // Origin is reachable in zero steps and "steps" onto itself.
    CHECK(bfs.route_to({2, 2}) == Route{0, {2, 2}});
}

TEST_CASE("FirstStepBfs/DetoursAroundWallsAndUnits") {
    // .....
    // .###.
    // ..S..
    Board b = OpenRoom(3, 5);
    for (int c = 1; c <= 3; ++c)
        b.set_floor({1, c}, false);

    auto blocked = NoBlocks(b);
    blocked[to_id({2, 1}, b.cols())] = 1; // a unit stands left of the origin

    FirstStepBfs bfs(b);
    bfs.search({2, 2}, blocked);

    // Only the right-hand corridor is open now.
    const auto r = bfs.route_to({0, 2});
    REQUIRE(r.has_value());
    CHECK(r->distance == 6);
    CHECK(r->first_step == Coord{2, 3});

    CHECK_FALSE(bfs.route_to({2, 1}).has_value()); // occupied
    CHECK_FALSE(bfs.route_to({1, 2}).has_value()); // wall
    CHECK_FALSE(bfs.route_to({9, 9}).has_value()); // off the board
}

TEST_CASE("FirstStepBfs/SealedOriginReachesNothing") {
    Board b = OpenRoom(3, 3);
    b.set_floor({0, 1}, false);
    b.set_floor({1, 0}, false);
    b.set_floor({1, 2}, false);
    b.set_floor({2, 1}, false);

    FirstStepBfs bfs(b);
    bfs.search({1, 1}, NoBlocks(b));

    CHECK(bfs.route_to({1, 1}) == Route{0, {1, 1}});
    CHECK_FALSE(bfs.route_to({0, 0}).has_value());
    CHECK_FALSE(bfs.route_to({2, 2}).has_value());
}
