/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Direction.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

using RoomId = uint32_t;
using MapId = uint32_t;

// A cell address: rooms are unique per (map, x, y).
struct Coord {
    MapId map{};
    int x{};
    int y{};

    [[nodiscard]] Coord step(Direction dir) const noexcept {
        const auto offset = unit_offset(dir);
        return Coord{map, x + offset.dx, y + offset.dy};
    }
    bool operator==(const Coord &) const = default;
};

template <>
struct std::hash<Coord> {
    size_t operator()(const Coord &coord) const noexcept {
        const auto h1 = std::hash<MapId>()(coord.map);
        const auto h2 = std::hash<int>()(coord.x);
        const auto h3 = std::hash<int>()(coord.y);
        return (h1 * 31 + h2) * 31 + h3;
    }
};

// A one-way link out of a room. Returning requires the destination to hold its own portal back.
struct Portal {
    Direction direction{Direction::North};
    Coord target;
};

struct Map {
    MapId id{};
    std::string name;
    std::string description;
    // Derived from the bounds of the map's rooms.
    int width{};
    int height{};
};

struct Room {
    RoomId id{};
    Coord coord;
    std::string name;
    std::string description;
    std::string type{"normal"};
    std::optional<Portal> portal;
};
