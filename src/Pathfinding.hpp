/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Direction.hpp"
#include "TopologyStore.hpp"

#include <optional>
#include <string>
#include <vector>

struct RouteStep {
    Direction direction;
    // The room this step arrives in.
    RoomId room;

    bool operator==(const RouteStep &) const = default;
};
using Route = std::vector<RouteStep>;

// Breadth first search over same-map adjacency and portals, so the route has the fewest moves. Among equally short
// routes the one found first in planar direction order wins. An empty route means origin and destination are the
// same room; nullopt means no route exists (or either room is unknown).
[[nodiscard]] std::optional<Route> shortest_path(const TopologyStore &topology, RoomId origin, RoomId destination);

// Compass codes of the steps, e.g. "N, NE, E".
[[nodiscard]] std::string describe_route(const Route &route);
