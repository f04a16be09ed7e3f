/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Game.hpp"

#include "ArgParser.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

Game::Game(World &world, PresenceRegistry &presence, const RoomBroadcaster &broadcaster, NpcScheduler &scheduler,
           Navigator &navigator)
    : world_(world), presence_(presence), broadcaster_(broadcaster), scheduler_(scheduler), navigator_(navigator),
      log_(logger_for("Game")) {}

void Game::send(const Session &session, EventKind kind, std::string text) const {
    if (!session.connection->send(Event{kind, std::move(text)}))
        log_.debug("Unable to send to {}", session.identity.value_or("an unnamed connection"));
}

void Game::send(const std::string &identity, EventKind kind, std::string text) const {
    if (auto connection = presence_.connection_of(identity)) {
        if (!connection->send(Event{kind, std::move(text)}))
            log_.debug("Unable to send to {}", identity);
    }
}

void Game::on_connect(SessionId id, std::shared_ptr<Connection> connection) {
    auto &session = sessions_[id];
    session.connection = std::move(connection);
    session.identity.reset();
    send(session, EventKind::Message, "Welcome to Newhaven. Choose your player with: play <name>");
}

bool Game::on_line(SessionId id, std::string_view line, Time now) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        log_.warn("Line from unknown session {}", id);
        return false;
    }
    auto &session = it->second;
    ArgParser args(trim(line));
    if (args.empty())
        return true;
    const auto command = lower_case(args.shift());

    if (command == "quit")
        return false;
    if (command == "play" || command == "select") {
        do_play(session, args, now);
        return true;
    }
    if (!session.identity) {
        send(session, EventKind::Error, "Choose a player first: play <name>");
        return true;
    }

    if (command == "look" || command == "l")
        do_look(session, args, now);
    else if (command == "move") {
        if (auto direction = try_parse_direction(args.shift()))
            do_move(session, *direction, now);
        else
            send(session, EventKind::Error, world_.messages.format("movement_invalid"));
    } else if (command == "route")
        do_route(session, args);
    else if (command == "go")
        do_go(session, args, now);
    else if (command == "run")
        do_run(session, args, now);
    else if (command == "stop")
        do_stop(session);
    else if (command == "continue")
        do_continue(session, now);
    else if (command == "harvest")
        do_harvest(session, args, now);
    else if (auto direction = try_parse_direction(command))
        do_move(session, *direction, now);
    else
        send(session, EventKind::Error, "Huh?");
    return true;
}

void Game::on_disconnect(SessionId id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return;
    if (const auto &identity = it->second.identity) {
        navigator_.remove(*identity);
        scheduler_.request_end_harvest(*identity);
        if (auto room = presence_.remove(*identity)) {
            broadcaster_.broadcast(
                *room,
                Event{EventKind::PeerLeft, world_.messages.format("player_left_world", fmt::arg("name", *identity))});
        }
        log_.info("{} has left the world", *identity);
    }
    sessions_.erase(it);
}

void Game::do_play(Session &session, ArgParser &args, Time now) {
    if (session.identity) {
        send(session, EventKind::Error, fmt::format("You are already playing as {}.", *session.identity));
        return;
    }
    const auto name = args.shift();
    auto player = world_.players.find(name);
    if (name.empty() || !player) {
        send(session, EventKind::Error, world_.messages.format("player_not_found"));
        return;
    }

    auto room = player->room;
    if (!world_.topology.room_by_id(room)) {
        if (!world_.start_room) {
            log_.error("{} is in missing room {} and there is no start room", player->name, room);
            send(session, EventKind::Error, world_.messages.format("player_not_found"));
            return;
        }
        log_.warn("{} was in missing room {}; moving them to the start room", player->name, room);
        room = *world_.start_room;
        world_.players.save_room(player->name, room);
    }

    switch (presence_.add(player->name, session.connection, room)) {
    case PresenceResult::Added: break;
    case PresenceResult::Duplicate:
        log_.info("Rejected a second connection for {}", player->name);
        send(session, EventKind::Error, world_.messages.format("player_already_connected"));
        return;
    case PresenceResult::UnknownRoom:
        send(session, EventKind::Error, world_.messages.format("player_not_found"));
        return;
    }

    session.identity = player->name;
    log_.info("{} has entered the world in room {}", player->name, room);
    send(session, EventKind::RoomState, describe_room(*world_.topology.room_by_id(room), player->name, now));
    broadcaster_.broadcast(room,
                           Event{EventKind::PeerJoined,
                                 world_.messages.format("player_entered_world", fmt::arg("name", player->name))},
                           player->name);
}

const Room *Game::current_room(const std::string &identity) const {
    if (auto room = presence_.room_of(identity))
        return world_.topology.room_by_id(*room);
    return nullptr;
}

std::optional<std::string> Game::identity_of(SessionId id) const {
    if (auto it = sessions_.find(id); it != sessions_.end())
        return it->second.identity;
    return {};
}
