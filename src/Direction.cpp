/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Direction.hpp"

#include "string_utils.hpp"

#include <fmt/format.h>

#include <stdexcept>

using namespace std::literals;

Direction reverse(Direction dir) {
    switch (dir) {
    case Direction::North: return Direction::South;
    case Direction::South: return Direction::North;
    case Direction::East: return Direction::West;
    case Direction::West: return Direction::East;
    case Direction::NorthEast: return Direction::SouthWest;
    case Direction::NorthWest: return Direction::SouthEast;
    case Direction::SouthEast: return Direction::NorthWest;
    case Direction::SouthWest: return Direction::NorthEast;
    case Direction::Up: return Direction::Down;
    case Direction::Down: return Direction::Up;
    }
    throw std::runtime_error(fmt::format("Bad direction {}", static_cast<int>(dir)));
}

std::string_view to_string(Direction dir) {
    switch (dir) {
    case Direction::North: return "north"sv;
    case Direction::South: return "south"sv;
    case Direction::East: return "east"sv;
    case Direction::West: return "west"sv;
    case Direction::NorthEast: return "northeast"sv;
    case Direction::NorthWest: return "northwest"sv;
    case Direction::SouthEast: return "southeast"sv;
    case Direction::SouthWest: return "southwest"sv;
    case Direction::Up: return "up"sv;
    case Direction::Down: return "down"sv;
    }
    throw std::runtime_error(fmt::format("Bad direction {}", static_cast<int>(dir)));
}

std::string_view short_name(Direction dir) {
    switch (dir) {
    case Direction::North: return "N"sv;
    case Direction::South: return "S"sv;
    case Direction::East: return "E"sv;
    case Direction::West: return "W"sv;
    case Direction::NorthEast: return "NE"sv;
    case Direction::NorthWest: return "NW"sv;
    case Direction::SouthEast: return "SE"sv;
    case Direction::SouthWest: return "SW"sv;
    case Direction::Up: return "U"sv;
    case Direction::Down: return "D"sv;
    }
    throw std::runtime_error(fmt::format("Bad direction {}", static_cast<int>(dir)));
}

bool is_vertical(Direction dir) noexcept { return dir == Direction::Up || dir == Direction::Down; }

Offset unit_offset(Direction dir) noexcept {
    switch (dir) {
    case Direction::North: return {0, 1};
    case Direction::South: return {0, -1};
    case Direction::East: return {1, 0};
    case Direction::West: return {-1, 0};
    case Direction::NorthEast: return {1, 1};
    case Direction::NorthWest: return {-1, 1};
    case Direction::SouthEast: return {1, -1};
    case Direction::SouthWest: return {-1, -1};
    case Direction::Up:
    case Direction::Down: break;
    }
    return {0, 0};
}

std::optional<Direction> try_parse_direction(std::string_view name) {
    name = trim(name);
    for (auto dir : all_directions)
        if (matches(name, short_name(dir)))
            return dir;
    for (auto dir : all_directions)
        if (matches_start(name, to_string(dir)))
            return dir;
    return {};
}
