/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Topology.hpp"

#include "string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>

void Topology::add_map(Map map) {
    if (maps_.contains(map.id))
        throw TopologyError(fmt::format("Duplicate map id {}", map.id));
    if (map_by_name(map.name))
        throw TopologyError(fmt::format("Duplicate map name '{}'", map.name));
    map.width = 0;
    map.height = 0;
    bounds_[map.id] = Bounds{};
    const auto id = map.id;
    maps_.emplace(id, std::move(map));
}

const Room &Topology::add_room(Room room) {
    if (!maps_.contains(room.coord.map))
        throw TopologyError(fmt::format("Room {} is in unknown map {}", room.id, room.coord.map));
    if (rooms_.contains(room.id))
        throw TopologyError(fmt::format("Duplicate room id {}", room.id));
    if (auto existing = room_at(room.coord))
        throw TopologyError(fmt::format("Room {} would share map {} ({}, {}) with room {}", room.id, room.coord.map,
                                        room.coord.x, room.coord.y, existing->id));
    if (room.portal && is_vertical(room.portal->direction))
        throw TopologyError(fmt::format("Room {} has a vertical portal", room.id));

    grow_bounds(room.coord);
    rooms_by_coord_.emplace(room.coord, room.id);
    const auto id = room.id;
    return rooms_.emplace(id, std::move(room)).first->second;
}

void Topology::set_portal(RoomId room_id, Portal portal) {
    auto it = rooms_.find(room_id);
    if (it == rooms_.end())
        throw TopologyError(fmt::format("Portal from unknown room {}", room_id));
    if (is_vertical(portal.direction))
        throw TopologyError(fmt::format("Room {} has a vertical portal", room_id));
    it->second.portal = portal;
}

void Topology::grow_bounds(const Coord &coord) {
    auto &bounds = bounds_[coord.map];
    if (bounds.empty) {
        bounds = Bounds{coord.x, coord.x, coord.y, coord.y, false};
    } else {
        bounds.min_x = std::min(bounds.min_x, coord.x);
        bounds.max_x = std::max(bounds.max_x, coord.x);
        bounds.min_y = std::min(bounds.min_y, coord.y);
        bounds.max_y = std::max(bounds.max_y, coord.y);
    }
    auto &map = maps_.at(coord.map);
    map.width = bounds.max_x - bounds.min_x + 1;
    map.height = bounds.max_y - bounds.min_y + 1;
}

const Room *Topology::room_by_id(RoomId id) const {
    if (auto it = rooms_.find(id); it != rooms_.end())
        return &it->second;
    return nullptr;
}

const Room *Topology::room_at(const Coord &coord) const {
    if (auto it = rooms_by_coord_.find(coord); it != rooms_by_coord_.end())
        return room_by_id(it->second);
    return nullptr;
}

std::vector<const Room *> Topology::rooms_in_map(MapId map) const {
    std::vector<const Room *> result;
    for (const auto &[id, room] : rooms_)
        if (room.coord.map == map)
            result.push_back(&room);
    std::sort(result.begin(), result.end(), [](const Room *lhs, const Room *rhs) { return lhs->id < rhs->id; });
    return result;
}

const Map *Topology::map_by_id(MapId id) const {
    if (auto it = maps_.find(id); it != maps_.end())
        return &it->second;
    return nullptr;
}

const Map *Topology::map_by_name(std::string_view name) const {
    for (const auto &[id, map] : maps_)
        if (matches(name, map.name))
            return &map;
    return nullptr;
}
