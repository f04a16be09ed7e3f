/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Pathfinding.hpp"

#include "Movement.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>

namespace {

struct Arrival {
    RoomId from;
    Direction direction;
};

Route walk_back(const std::unordered_map<RoomId, Arrival> &arrivals, RoomId origin, RoomId destination) {
    Route route;
    for (auto room = destination; room != origin;) {
        const auto &arrival = arrivals.at(room);
        route.push_back(RouteStep{arrival.direction, room});
        room = arrival.from;
    }
    std::reverse(route.begin(), route.end());
    return route;
}

}

std::optional<Route> shortest_path(const TopologyStore &topology, RoomId origin, RoomId destination) {
    const auto *start = topology.room_by_id(origin);
    if (!start || !topology.room_by_id(destination))
        return {};
    if (origin == destination)
        return Route{};

    // Rooms are marked when first discovered, so each is reached by its earliest (and shortest) path.
    std::unordered_map<RoomId, Arrival> arrivals;
    std::deque<const Room *> frontier{start};
    while (!frontier.empty()) {
        const auto *room = frontier.front();
        frontier.pop_front();
        for (const auto &next : neighbours(topology, *room)) {
            const auto next_id = next.room->id;
            if (next_id == origin || arrivals.contains(next_id))
                continue;
            arrivals.emplace(next_id, Arrival{room->id, next.direction});
            if (next_id == destination)
                return walk_back(arrivals, origin, destination);
            frontier.push_back(next.room);
        }
    }
    return {};
}

std::string describe_route(const Route &route) {
    std::vector<std::string> codes;
    for (const auto &step : route)
        codes.emplace_back(short_name(step.direction));
    return join(codes, ", ");
}
