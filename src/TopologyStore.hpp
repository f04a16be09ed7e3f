/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Room.hpp"

#include <string_view>
#include <vector>

// Read access to the maps and rooms of the world. Lookups return nullptr when nothing matches.
struct TopologyStore {
    virtual ~TopologyStore() = default;

    [[nodiscard]] virtual const Room *room_by_id(RoomId id) const = 0;
    [[nodiscard]] virtual const Room *room_at(const Coord &coord) const = 0;
    [[nodiscard]] virtual std::vector<const Room *> rooms_in_map(MapId map) const = 0;
    [[nodiscard]] virtual const Map *map_by_id(MapId id) const = 0;
    [[nodiscard]] virtual const Map *map_by_name(std::string_view name) const = 0;
};
