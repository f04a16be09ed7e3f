/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include <array>
#include <optional>
#include <string_view>

enum class Direction { North, South, East, West, NorthEast, NorthWest, SouthEast, SouthWest, Up, Down };

// Planar directions in the order rooms are expanded when pathfinding and listed as exits. Routes are deterministic
// because of this ordering: do not reorder.
static inline constexpr std::array<Direction, 8> planar_directions = {
    {Direction::North, Direction::South, Direction::East, Direction::West, Direction::NorthEast, Direction::NorthWest,
     Direction::SouthEast, Direction::SouthWest}};

static inline constexpr std::array<Direction, 10> all_directions = {
    {Direction::North, Direction::South, Direction::East, Direction::West, Direction::NorthEast, Direction::NorthWest,
     Direction::SouthEast, Direction::SouthWest, Direction::Up, Direction::Down}};

struct Offset {
    int dx;
    int dy;
};

[[nodiscard]] Direction reverse(Direction dir);
// Long lower case name, e.g. "northeast".
[[nodiscard]] std::string_view to_string(Direction dir);
// Compass code, e.g. "NE".
[[nodiscard]] std::string_view short_name(Direction dir);
[[nodiscard]] bool is_vertical(Direction dir) noexcept;
// The unit step for a planar direction; y grows northwards. Vertical directions have no planar offset.
[[nodiscard]] Offset unit_offset(Direction dir) noexcept;
// Accepts a compass code ("ne", "u") or a prefix of a long name ("nor"), case insensitively.
[[nodiscard]] std::optional<Direction> try_parse_direction(std::string_view name);

// A value for each direction, indexed by Direction.
template <typename T>
class PerDirection {
    std::array<T, all_directions.size()> values_{};

public:
    constexpr T &operator[](Direction d) { return values_[static_cast<size_t>(d)]; }
    constexpr const T &operator[](Direction d) const { return values_[static_cast<size_t>(d)]; }
};
