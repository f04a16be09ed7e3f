/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "SavedRoutes.hpp"

#include "Movement.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

#include <stdexcept>

void SavedRoutes::add(SavedRoute route) {
    auto key = lower_case(route.name);
    if (routes_.contains(key))
        throw std::invalid_argument(fmt::format("Duplicate route {}", route.name));
    routes_.emplace(std::move(key), std::move(route));
}

const SavedRoute *SavedRoutes::find(std::string_view name) const {
    if (auto it = routes_.find(lower_case(name)); it != routes_.end())
        return &it->second;
    return nullptr;
}

std::optional<Route> expand_route(const TopologyStore &topology, const SavedRoute &saved) {
    const auto *room = topology.room_by_id(saved.origin);
    if (!room || saved.directions.empty())
        return {};
    Route route;
    for (auto direction : saved.directions) {
        const auto resolution = resolve_move(topology, *room, direction);
        const auto *destination = std::get_if<MoveDestination>(&resolution);
        if (!destination)
            return {};
        room = destination->room;
        route.push_back(RouteStep{direction, room->id});
    }
    if (saved.mode == RouteMode::Loop && route.back().room != saved.origin)
        return {};
    return route;
}
