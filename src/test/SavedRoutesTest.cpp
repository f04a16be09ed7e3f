#include "SavedRoutes.hpp"
#include "TestWorld.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace test;

TEST_CASE("Saved routes") {
    Topology topology;
    topology.add_map(make_map(1, "Meadow"));
    add_grid(topology, 1, 3, 2, 1);
    SavedRoutes routes;
    routes.add(SavedRoute{"Fence Walk", RouteMode::Loop, 1, {Direction::East, Direction::North, Direction::West,
                                                              Direction::South}});

    SECTION("should find routes by name") {
        REQUIRE(routes.find("fence walk"));
        CHECK(routes.find("FENCE WALK")->mode == RouteMode::Loop);
        CHECK(!routes.find("fence"));
        CHECK(routes.size() == 1);
    }
    SECTION("should reject duplicate names") {
        CHECK_THROWS_AS(routes.add(SavedRoute{"fence walk", RouteMode::Path, 1, {Direction::East}}),
                        std::invalid_argument);
    }
    SECTION("should expand into rooms") {
        const auto route = expand_route(topology, *routes.find("Fence Walk"));
        REQUIRE(route);
        CHECK(describe_route(*route) == "E, N, W, S");
        CHECK(route->back().room == 1);
        CHECK((*route)[1].room == topology.room_at(Coord{1, 1, 1})->id);
    }
    SECTION("should not expand a route that runs into a wall") {
        const SavedRoute bad{"Off the edge", RouteMode::Path, 1, {Direction::East, Direction::South}};
        CHECK(!expand_route(topology, bad));
    }
    SECTION("should not expand a route from a missing room") {
        const SavedRoute bad{"Lost", RouteMode::Path, 99, {Direction::East}};
        CHECK(!expand_route(topology, bad));
    }
    SECTION("should not expand a loop that doesn't return to its start") {
        const SavedRoute open{"Open Road", RouteMode::Loop, 1, {Direction::East, Direction::East}};
        CHECK(!expand_route(topology, open));
        SECTION("though the same walk is fine as a path") {
            const SavedRoute path{"Open Road", RouteMode::Path, 1, {Direction::East, Direction::East}};
            REQUIRE(expand_route(topology, path));
            CHECK(expand_route(topology, path)->back().room == topology.room_at(Coord{1, 2, 0})->id);
        }
    }
    SECTION("should not expand a route with no steps") {
        const SavedRoute empty{"Nowhere", RouteMode::Path, 1, {}};
        CHECK(!expand_route(topology, empty));
    }
}
