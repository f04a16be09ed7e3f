/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Movement.hpp"

PerDirection<bool> exits(const TopologyStore &topology, const Room &room) {
    PerDirection<bool> result;
    for (auto dir : planar_directions) {
        const bool portal_this_way = room.portal && room.portal->direction == dir;
        result[dir] = portal_this_way || topology.room_at(room.coord.step(dir)) != nullptr;
    }
    return result;
}

std::vector<Direction> open_exits(const TopologyStore &topology, const Room &room) {
    const auto open = exits(topology, room);
    std::vector<Direction> result;
    for (auto dir : planar_directions)
        if (open[dir])
            result.push_back(dir);
    return result;
}

MoveResolution resolve_move(const TopologyStore &topology, const Room &room, Direction direction) {
    if (is_vertical(direction))
        return VerticalUnsupported{direction};
    if (room.portal && room.portal->direction == direction) {
        if (auto *target = topology.room_at(room.portal->target))
            return MoveDestination{target, true};
        return MoveBlocked{direction};
    }
    if (auto *adjacent = topology.room_at(room.coord.step(direction)))
        return MoveDestination{adjacent, false};
    return MoveBlocked{direction};
}

std::vector<Neighbour> neighbours(const TopologyStore &topology, const Room &room) {
    std::vector<Neighbour> result;
    for (auto dir : planar_directions) {
        const auto resolution = resolve_move(topology, room, dir);
        if (auto *dest = std::get_if<MoveDestination>(&resolution))
            result.push_back(Neighbour{dir, dest->room, dest->map_transition});
    }
    return result;
}
