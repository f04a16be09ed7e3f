/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "TopologyStore.hpp"

#include <map>
#include <stdexcept>
#include <unordered_map>

// Raised when the world being built would break a topology rule.
class TopologyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The in-memory topology. It is populated once when the world loads and is read-only afterwards, so lookups need
// no locking.
class Topology : public TopologyStore {
    struct Bounds {
        int min_x{};
        int max_x{};
        int min_y{};
        int max_y{};
        bool empty{true};
    };

    std::map<MapId, Map> maps_;
    std::map<MapId, Bounds> bounds_;
    std::unordered_map<RoomId, Room> rooms_;
    std::unordered_map<Coord, RoomId> rooms_by_coord_;

    void grow_bounds(const Coord &coord);

public:
    void add_map(Map map);
    // Adds a room, keeping (map, x, y) unique. Returns the stored room.
    const Room &add_room(Room room);
    void set_portal(RoomId room, Portal portal);

    [[nodiscard]] const Room *room_by_id(RoomId id) const override;
    [[nodiscard]] const Room *room_at(const Coord &coord) const override;
    [[nodiscard]] std::vector<const Room *> rooms_in_map(MapId map) const override;
    [[nodiscard]] const Map *map_by_id(MapId id) const override;
    [[nodiscard]] const Map *map_by_name(std::string_view name) const override;

    [[nodiscard]] size_t room_count() const noexcept { return rooms_.size(); }
};
