/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Game.hpp"

#include "ArgParser.hpp"
#include "Pathfinding.hpp"
#include "SavedRoutes.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

std::optional<RoomId> Game::parse_room_argument(const Session &session, ArgParser &args) const {
    const auto number = args.try_shift_number();
    if (!number || *number < 0 || !world_.topology.room_by_id(static_cast<RoomId>(*number))) {
        send(session, EventKind::Error, "Which room? Give a room number.");
        return {};
    }
    return static_cast<RoomId>(*number);
}

void Game::do_route(Session &session, ArgParser &args) {
    const auto *room = current_room(*session.identity);
    const auto destination = parse_room_argument(session, args);
    if (!room || !destination)
        return;
    const auto route = shortest_path(world_.topology, room->id, *destination);
    if (!route) {
        send(session, EventKind::RouteFailed, world_.messages.format("route_unreachable"));
        return;
    }
    if (route->empty()) {
        send(session, EventKind::RouteComputed, world_.messages.format("route_here"));
        return;
    }
    send(session, EventKind::RouteComputed,
         world_.messages.format("route_computed", fmt::arg("room", world_.topology.room_by_id(*destination)->name),
                                fmt::arg("steps", describe_route(*route)), fmt::arg("count", route->size())));
}

void Game::do_go(Session &session, ArgParser &args, Time now) {
    const auto &identity = *session.identity;
    const auto *room = current_room(identity);
    const auto destination = parse_room_argument(session, args);
    if (!room || !destination)
        return;
    auto route = shortest_path(world_.topology, room->id, *destination);
    if (!route) {
        send(session, EventKind::RouteFailed, world_.messages.format("route_unreachable"));
        return;
    }
    if (route->empty()) {
        send(session, EventKind::RouteComplete, world_.messages.format("route_here"));
        return;
    }
    const auto &name = world_.topology.room_by_id(*destination)->name;
    const auto count = route->size();
    navigator_.start(identity, name, std::move(*route), RouteMode::Path, now);
    send(session, EventKind::RouteComputed,
         world_.messages.format("route_started", fmt::arg("room", name), fmt::arg("count", count)));
}

void Game::do_run(Session &session, ArgParser &args, Time now) {
    const auto &identity = *session.identity;
    const auto *room = current_room(identity);
    const auto name = trim(args.remaining());
    if (!room)
        return;
    const auto *saved = world_.routes.find(name);
    if (!saved) {
        send(session, EventKind::Error, world_.messages.format("route_unknown", fmt::arg("route", name)));
        return;
    }
    auto steps = expand_route(world_.topology, *saved);
    if (!steps) {
        log_.warn("Saved route {} no longer fits the world", saved->name);
        send(session, EventKind::RouteFailed,
             world_.messages.format("route_invalid_steps", fmt::arg("route", saved->name)));
        return;
    }
    const auto count = steps->size();
    if (room->id == saved->origin) {
        navigator_.start(identity, saved->name, std::move(*steps), saved->mode, now);
        send(session, EventKind::RouteComputed,
             world_.messages.format("route_run_started", fmt::arg("route", saved->name), fmt::arg("count", count)));
        return;
    }

    auto approach = shortest_path(world_.topology, room->id, saved->origin);
    if (!approach) {
        send(session, EventKind::RouteFailed,
             world_.messages.format("route_origin_unreachable", fmt::arg("route", saved->name)));
        return;
    }
    navigator_.start_via(identity, std::move(*approach), saved->name, std::move(*steps), saved->mode, now);
    send(session, EventKind::RouteComputed, world_.messages.format("route_approach", fmt::arg("route", saved->name)));
}

void Game::do_stop(Session &session) {
    const auto &identity = *session.identity;
    const auto room = presence_.room_of(identity);
    if (!room)
        return;
    switch (navigator_.pause(identity, *room)) {
    case PauseResult::Paused: send(session, EventKind::RouteProgress, world_.messages.format("route_paused")); break;
    case PauseResult::Cancelled:
        send(session, EventKind::RouteFailed, world_.messages.format("route_cancelled"));
        break;
    case PauseResult::NothingToPause:
        send(session, EventKind::Error, world_.messages.format("route_nothing_running"));
        break;
    }
}

void Game::do_continue(Session &session, Time now) {
    const auto &identity = *session.identity;
    const auto room = presence_.room_of(identity);
    if (!room)
        return;
    switch (navigator_.resume(identity, *room, now)) {
    case ResumeResult::Resumed: send(session, EventKind::RouteProgress, world_.messages.format("route_resumed")); break;
    case ResumeResult::Stale: send(session, EventKind::RouteFailed, world_.messages.format("route_stale")); break;
    case ResumeResult::NothingPaused:
        send(session, EventKind::Error, world_.messages.format("route_nothing_paused"));
        break;
    }
}
