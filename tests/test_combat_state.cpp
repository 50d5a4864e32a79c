#include <doctest/doctest.h>

#include "skirmish/combat/CombatState.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace skirmish::combat;

namespace {

std::shared_ptr<const skirmish::pf::Board> Corridor(int cols) {
    auto b = std::make_shared<skirmish::pf::Board>(1, cols);
    for (int c = 0; c < cols; ++c)
        b->set_floor({0, c}, true);
    return b;
}

} // namespace

TEST_CASE("CombatState: occupancy follows moves and deaths") {
    CombatState s(Corridor(6), {
        Unit{{0, 4}, 200, Faction::Goblin},
        Unit{{0, 1}, 200, Faction::Elf},
    });

    CHECK(s.occupied_tiles() == std::vector<Coord>{{0, 1}, {0, 4}});

    s.move_unit(1, {0, 2});
    CHECK_FALSE(s.is_occupied({0, 1}));
    CHECK(s.is_occupied({0, 2}));
    CHECK(s.unit_at({0, 2}) == 1);
    CHECK(s.check_occupancy());

    CHECK_FALSE(s.apply_damage(0, 199));
    CHECK(s.unit(0).hit_points == 1);
    CHECK(s.apply_damage(0, 3));
    CHECK_FALSE(s.is_occupied({0, 4}));
    CHECK(s.unit_at({0, 4}) == kNoUnit);
    CHECK(s.check_occupancy());

    CHECK(s.deaths(Faction::Goblin) == 1);
    CHECK(s.living_count(Faction::Goblin) == 0);
    CHECK(s.living_count(Faction::Elf) == 1);
    CHECK(s.remaining_hp() == 200);
    CHECK(s.size() == 2); // the dead keep their slot
}

TEST_CASE("CombatState: sorting restores reading order") {
    CombatState s(Corridor(6), {
        Unit{{0, 0}, 200, Faction::Elf},
        Unit{{0, 3}, 200, Faction::Goblin},
    });
    s.move_unit(0, {0, 5});
    s.sort_reading_order();

    CHECK(s.unit(0).position == Coord{0, 3});
    CHECK(s.unit(1).position == Coord{0, 5});
    CHECK(s.check_occupancy());
}

TEST_CASE("CombatState: corrupt operations are invariant violations") {
    CombatState s(Corridor(4), {
        Unit{{0, 0}, 200, Faction::Elf},
        Unit{{0, 1}, 3, Faction::Goblin},
    });

    CHECK_THROWS_AS(s.move_unit(0, {0, 1}), std::logic_error);   // occupied
    CHECK_THROWS_AS(s.move_unit(0, {1, 0}), std::logic_error);   // off the board

    CHECK(s.apply_damage(1, 3));
    CHECK_THROWS_AS(s.apply_damage(1, 3), std::logic_error);     // already dead
    CHECK_THROWS_AS(s.move_unit(1, {0, 2}), std::logic_error);   // dead units stay put

    CHECK_THROWS_AS(CombatState(Corridor(4), {Unit{{0, 1}, 1, Faction::Elf}, Unit{{0, 1}, 1, Faction::Goblin}}),
                    std::invalid_argument);
}

TEST_CASE("CombatState: copies are independent replays") {
    const CombatState pristine(Corridor(4), {
        Unit{{0, 0}, 200, Faction::Elf},
        Unit{{0, 3}, 200, Faction::Goblin},
    });

    CombatState copy = pristine;
    copy.set_attack_power(Faction::Elf, 40);
    copy.move_unit(0, {0, 1});

    CHECK(pristine.unit(0).position == Coord{0, 0});
    CHECK(pristine.attack_power(Faction::Elf) == 3);
    CHECK(&pristine.board() == &copy.board());
}
