/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Game.hpp"

#include "ArgParser.hpp"
#include "Movement.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

std::string Game::describe_room(const Room &room, std::string_view viewer, Time now) const {
    const auto *map = world_.topology.map_by_id(room.coord.map);
    std::vector<std::string> lines;
    lines.push_back(fmt::format("{} [{}] ({}, {})", room.name, map ? map->name : "?", room.coord.x, room.coord.y));
    if (!room.description.empty())
        lines.push_back(room.description);

    // Players first, alphabetically, then NPCs in slot order.
    auto here = presence_.occupants_of(room.id, viewer);
    for (const auto &actor : world_.actors.in_room(room.id))
        here.push_back(fmt::format("{} {}", actor.definition.name, status_text(actor, now)));
    if (here.empty())
        lines.push_back(world_.messages.format("room_no_one_here"));
    else
        lines.push_back(world_.messages.format("room_also_here", fmt::arg("entities", join(here, ", "))));

    std::vector<std::string> exit_names;
    for (auto dir : open_exits(world_.topology, room))
        exit_names.emplace_back(to_string(dir));
    lines.push_back(world_.messages.format("room_obvious_exits",
                                           fmt::arg("directions", exit_names.empty() ? "none" : join(exit_names, ", "))));

    std::vector<std::string> items;
    for (const auto &item : world_.ground.items_in(room.id))
        items.push_back(item.quantity > 1 ? fmt::format("{} ({})", item.name, item.quantity) : item.name);
    if (!items.empty())
        lines.push_back(world_.messages.format("room_on_ground", fmt::arg("items", join(items, ", "))));

    return join(lines, "\n\r");
}

std::vector<ActorRecord> Game::matching_actors(RoomId room, std::string_view target) const {
    std::vector<ActorRecord> result;
    for (auto &actor : world_.actors.in_room(room))
        if (matches_name(target, actor.definition.name))
            result.push_back(std::move(actor));
    return result;
}

void Game::do_look(Session &session, ArgParser &args, Time now) {
    const auto &identity = *session.identity;
    const auto *room = current_room(identity);
    if (!room) {
        send(session, EventKind::Error, "You are nowhere; reconnect to rejoin the world.");
        return;
    }
    const auto target = trim(args.remaining());
    if (target.empty()) {
        send(session, EventKind::RoomState, describe_room(*room, identity, now));
        return;
    }

    const auto found = matching_actors(room->id, target);
    if (found.empty()) {
        send(session, EventKind::Error, world_.messages.format("look_not_here", fmt::arg("target", target)));
        return;
    }
    const auto &actor = found.front();
    auto text = fmt::format("{} {}", actor.definition.name, status_text(actor, now));
    if (!actor.definition.description.empty())
        text += "\n\r" + actor.definition.description;
    send(session, EventKind::Message, std::move(text));
}
