/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Game.hpp"

#include "Movement.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <variant>

Game::MoveOutcome Game::move_player(const std::string &identity, Direction direction, Time now) {
    const auto *from = current_room(identity);
    if (!from)
        return MoveOutcome::Lost;

    const auto resolution = resolve_move(world_.topology, *from, direction);
    if (std::holds_alternative<VerticalUnsupported>(resolution))
        return MoveOutcome::Vertical;
    const auto *dest = std::get_if<MoveDestination>(&resolution);
    if (!dest)
        return MoveOutcome::Blocked;

    const auto *to = dest->room;
    if (!presence_.move_to(identity, to->id))
        return MoveOutcome::Lost;
    world_.players.save_room(identity, to->id);
    // Walking away ends any harvest; the scheduler ignores this if there wasn't one.
    scheduler_.request_end_harvest(identity);
    if (dest->map_transition)
        log_.debug("{} crossed from map {} to map {}", identity, from->coord.map, to->coord.map);

    broadcaster_.broadcast(from->id,
                           Event{EventKind::PeerLeft,
                                 world_.messages.format("player_left_to", fmt::arg("name", identity),
                                                        fmt::arg("direction", to_string(direction)))},
                           identity);
    broadcaster_.broadcast(to->id,
                           Event{EventKind::PeerJoined,
                                 world_.messages.format("player_arrives_from", fmt::arg("name", identity),
                                                        fmt::arg("direction", to_string(reverse(direction))))},
                           identity);
    send(identity, EventKind::MoveResult, describe_room(*to, identity, now));
    return MoveOutcome::Moved;
}

void Game::do_move(Session &session, Direction direction, Time now) {
    const auto &identity = *session.identity;
    // A manual move always wins over a route in progress.
    if (navigator_.interrupt(identity))
        send(session, EventKind::RouteFailed, world_.messages.format("route_interrupted"));

    switch (move_player(identity, direction, now)) {
    case MoveOutcome::Moved: break;
    case MoveOutcome::Blocked:
        send(session, EventKind::Error,
             world_.messages.format("movement_wall_collision", fmt::arg("direction", to_string(direction))));
        break;
    case MoveOutcome::Vertical: send(session, EventKind::Error, world_.messages.format("movement_vertical")); break;
    case MoveOutcome::Lost:
        log_.error("{} tried to move but isn't anywhere", identity);
        send(session, EventKind::Error, "You are nowhere; reconnect to rejoin the world.");
        break;
    }
}

void Game::pump(Time now) {
    for (const auto &due : navigator_.due(now)) {
        try {
            run_step(due, now);
        } catch (const std::exception &e) {
            log_.error("Guided step {}/{} for {} failed: {}", due.step_number, due.total, due.identity, e.what());
            navigator_.failed(due.identity, due.generation);
        }
    }
}

void Game::run_step(const DueStep &due, Time now) {
    const auto &identity = due.identity;
    const auto outcome = move_player(identity, due.step.direction, now);
    if (outcome != MoveOutcome::Moved) {
        navigator_.failed(identity, due.generation);
        if (outcome == MoveOutcome::Lost) {
            navigator_.remove(identity);
            return;
        }
        send(identity, EventKind::RouteFailed,
             world_.messages.format("route_blocked", fmt::arg("direction", to_string(due.step.direction))));
        return;
    }

    // The world may have changed under the route; a step that lands elsewhere ends it.
    const auto arrived_in = presence_.room_of(identity);
    if (arrived_in != due.step.room) {
        log_.info("{} expected room {} stepping {} but is in room {}", identity, due.step.room,
                  to_string(due.step.direction), arrived_in.value_or(0));
        navigator_.failed(identity, due.generation);
        send(identity, EventKind::RouteFailed,
             world_.messages.format("route_off_course", fmt::arg("direction", to_string(due.step.direction))));
        return;
    }

    const auto progress = navigator_.completed(identity, due.generation, *arrived_in, now);
    if (progress.outcome == StepOutcome::Superseded)
        return;
    send(identity, EventKind::RouteProgress,
         world_.messages.format("route_step", fmt::arg("step", due.step_number), fmt::arg("total", due.total),
                                fmt::arg("direction", to_string(due.step.direction))));
    switch (progress.outcome) {
    case StepOutcome::Continuing:
    case StepOutcome::Superseded: break;
    case StepOutcome::LapCompleted:
        send(identity, EventKind::RouteProgress,
             world_.messages.format("route_lap", fmt::arg("route", progress.route_name),
                                    fmt::arg("laps", progress.laps.value_or(0))));
        break;
    case StepOutcome::Completed:
        send(identity, EventKind::RouteComplete, world_.messages.format("route_complete"));
        break;
    case StepOutcome::FollowOnStarted:
        send(identity, EventKind::RouteProgress,
             world_.messages.format("route_origin_reached", fmt::arg("route", progress.route_name)));
        break;
    }
}
