/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Connection.hpp"
#include "Direction.hpp"
#include "Navigator.hpp"
#include "NpcScheduler.hpp"
#include "PresenceRegistry.hpp"
#include "RoomBroadcaster.hpp"
#include "World.hpp"
#include "common/Logger.hpp"
#include "common/Time.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class ArgParser;

using SessionId = uint32_t;

// The command layer. Interprets each line a client sends, moves players through the world and tells everyone
// concerned what happened. Driven from the single network thread; the scheduler thread only touches the shared
// stores, which lock for themselves.
class Game {
    struct Session {
        std::shared_ptr<Connection> connection;
        std::optional<std::string> identity;
    };

    enum class MoveOutcome { Moved, Blocked, Vertical, Lost };

    World &world_;
    PresenceRegistry &presence_;
    const RoomBroadcaster &broadcaster_;
    NpcScheduler &scheduler_;
    Navigator &navigator_;
    mutable Logger log_;
    std::unordered_map<SessionId, Session> sessions_;

    void send(const Session &session, EventKind kind, std::string text) const;
    void send(const std::string &identity, EventKind kind, std::string text) const;

    void do_play(Session &session, ArgParser &args, Time now);
    void do_move(Session &session, Direction direction, Time now);
    void do_look(Session &session, ArgParser &args, Time now);
    void do_route(Session &session, ArgParser &args);
    void do_go(Session &session, ArgParser &args, Time now);
    void do_run(Session &session, ArgParser &args, Time now);
    void do_stop(Session &session);
    void do_continue(Session &session, Time now);
    void do_harvest(Session &session, ArgParser &args, Time now);

    // The one way a player changes room, whether they typed the move or a guided route made it.
    MoveOutcome move_player(const std::string &identity, Direction direction, Time now);
    void run_step(const DueStep &due, Time now);
    [[nodiscard]] const Room *current_room(const std::string &identity) const;
    [[nodiscard]] std::optional<RoomId> parse_room_argument(const Session &session, ArgParser &args) const;
    [[nodiscard]] std::vector<ActorRecord> matching_actors(RoomId room, std::string_view target) const;

public:
    Game(World &world, PresenceRegistry &presence, const RoomBroadcaster &broadcaster, NpcScheduler &scheduler,
         Navigator &navigator);
    Game(const Game &) = delete;
    Game &operator=(const Game &) = delete;

    void on_connect(SessionId id, std::shared_ptr<Connection> connection);
    // Returns false when the client asked to leave.
    [[nodiscard]] bool on_line(SessionId id, std::string_view line, Time now);
    void on_disconnect(SessionId id);
    // Runs any guided steps that have come due.
    void pump(Time now);

    // The full description of a room as seen by the viewer.
    [[nodiscard]] std::string describe_room(const Room &room, std::string_view viewer, Time now) const;
    [[nodiscard]] std::optional<std::string> identity_of(SessionId id) const;
    [[nodiscard]] size_t session_count() const noexcept { return sessions_.size(); }
};
