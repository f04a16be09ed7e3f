/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "GroundInventory.hpp"
#include "InMemoryActorStore.hpp"
#include "MessageCatalogue.hpp"
#include "PlayerStore.hpp"
#include "SavedRoutes.hpp"
#include "Topology.hpp"

#include <optional>

// Everything loaded from the world file. The topology, routes and messages are fixed once loading finishes; the
// stores are shared with the scheduler and lock internally.
struct World {
    Topology topology;
    InMemoryActorStore actors;
    GroundInventory ground;
    InMemoryPlayerStore players;
    SavedRoutes routes;
    MessageCatalogue messages;
    // Where players go if their saved room has disappeared.
    std::optional<RoomId> start_room;
};
