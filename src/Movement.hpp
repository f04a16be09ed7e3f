/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Direction.hpp"
#include "TopologyStore.hpp"

#include <variant>
#include <vector>

// Successful resolution. A map transition means the move went through the room's portal.
struct MoveDestination {
    const Room *room;
    bool map_transition;
};
// Nothing there: either a dead end or a portal whose target room no longer exists.
struct MoveBlocked {
    Direction direction;
};
// Up and down are recognised but not walkable yet.
struct VerticalUnsupported {
    Direction direction;
};
using MoveResolution = std::variant<MoveDestination, MoveBlocked, VerticalUnsupported>;

// An outgoing edge of the room graph.
struct Neighbour {
    Direction direction;
    const Room *room;
    bool map_transition;
};

// Open exits per direction. A planar direction is open if the room's portal points that way or a room exists one
// step away on the same map. Vertical directions are never open.
[[nodiscard]] PerDirection<bool> exits(const TopologyStore &topology, const Room &room);
// The open exits in planar direction order.
[[nodiscard]] std::vector<Direction> open_exits(const TopologyStore &topology, const Room &room);

// A room's portal takes precedence over the same-map neighbour in its direction.
[[nodiscard]] MoveResolution resolve_move(const TopologyStore &topology, const Room &room, Direction direction);

// Every room reachable in one move, in planar direction order.
[[nodiscard]] std::vector<Neighbour> neighbours(const TopologyStore &topology, const Room &room);
