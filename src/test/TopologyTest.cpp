#include "Topology.hpp"
#include "TestWorld.hpp"

#include <catch2/catch.hpp>

using namespace test;

TEST_CASE("Topology") {
    Topology topology;
    topology.add_map(make_map(1, "Meadow"));
    topology.add_map(make_map(2, "Caves"));

    SECTION("should find rooms by id and by coordinate") {
        const auto &added = add_room(topology, 10, 1, 2, 3);
        CHECK(topology.room_by_id(10) == &added);
        CHECK(topology.room_at(Coord{1, 2, 3}) == &added);
        CHECK(!topology.room_at(Coord{2, 2, 3}));
        CHECK(!topology.room_by_id(11));
        CHECK(topology.room_count() == 1);
    }
    SECTION("should keep coordinates unique within a map") {
        add_room(topology, 10, 1, 0, 0);
        CHECK_THROWS_AS(add_room(topology, 11, 1, 0, 0), TopologyError);
        CHECK_NOTHROW(add_room(topology, 11, 2, 0, 0));
    }
    SECTION("should reject duplicate room ids") {
        add_room(topology, 10, 1, 0, 0);
        CHECK_THROWS_AS(add_room(topology, 10, 1, 1, 0), TopologyError);
    }
    SECTION("should reject rooms in unknown maps") { CHECK_THROWS_AS(add_room(topology, 10, 3, 0, 0), TopologyError); }
    SECTION("should reject duplicate maps") {
        CHECK_THROWS_AS(topology.add_map(make_map(1, "Elsewhere")), TopologyError);
        CHECK_THROWS_AS(topology.add_map(make_map(3, "MEADOW")), TopologyError);
    }
    SECTION("should find maps") {
        CHECK(topology.map_by_id(2)->name == "Caves");
        CHECK(topology.map_by_name("caves")->id == 2);
        CHECK(!topology.map_by_name("Cave"));
        CHECK(!topology.map_by_id(3));
    }
    SECTION("should derive map size from its rooms") {
        add_room(topology, 10, 1, -2, 0);
        add_room(topology, 11, 1, 3, 5);
        add_room(topology, 12, 2, 0, 0);
        const auto *meadow = topology.map_by_id(1);
        CHECK(meadow->width == 6);
        CHECK(meadow->height == 6);
        CHECK(topology.map_by_id(2)->width == 1);
    }
    SECTION("should list rooms in a map by id") {
        add_room(topology, 12, 1, 1, 0);
        add_room(topology, 10, 1, 0, 0);
        add_room(topology, 11, 2, 0, 0);
        const auto rooms = topology.rooms_in_map(1);
        REQUIRE(rooms.size() == 2);
        CHECK(rooms[0]->id == 10);
        CHECK(rooms[1]->id == 12);
    }
    SECTION("portals") {
        add_room(topology, 10, 1, 0, 0);
        SECTION("should store at most one per room") {
            topology.set_portal(10, Portal{Direction::North, Coord{2, 0, 0}});
            topology.set_portal(10, Portal{Direction::East, Coord{2, 1, 1}});
            const auto &portal = topology.room_by_id(10)->portal;
            REQUIRE(portal);
            CHECK(portal->direction == Direction::East);
            CHECK(portal->target == Coord{2, 1, 1});
        }
        SECTION("should not be vertical") {
            const Portal upwards{Direction::Up, Coord{2, 0, 0}};
            CHECK_THROWS_AS(topology.set_portal(10, upwards), TopologyError);
        }
        SECTION("should need a room to leave from") {
            const Portal northwards{Direction::North, Coord{2, 0, 0}};
            CHECK_THROWS_AS(topology.set_portal(99, northwards), TopologyError);
        }
    }
}
