/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Direction.hpp"
#include "Navigator.hpp"
#include "Pathfinding.hpp"
#include "TopologyStore.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// A named walk stored with the world: where it starts and which way to go at each step.
struct SavedRoute {
    std::string name;
    RouteMode mode{RouteMode::Path};
    RoomId origin{};
    std::vector<Direction> directions;
};

class SavedRoutes {
    std::map<std::string, SavedRoute, std::less<>> routes_;

public:
    // Throws std::invalid_argument if the name is taken.
    void add(SavedRoute route);
    // Case insensitive.
    [[nodiscard]] const SavedRoute *find(std::string_view name) const;
    [[nodiscard]] size_t size() const noexcept { return routes_.size(); }
};

// Walks the directions from the origin. Returns nullopt if the origin is gone, a step doesn't lead anywhere, there
// are no steps at all, or a loop doesn't finish back at its origin.
[[nodiscard]] std::optional<Route> expand_route(const TopologyStore &topology, const SavedRoute &saved);
