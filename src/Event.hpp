/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include <string>

enum class EventKind {
    RoomState,
    MoveResult,
    PeerJoined,
    PeerLeft,
    Message,
    RouteComputed,
    RouteProgress,
    RouteComplete,
    RouteFailed,
    Error
};

// One outbound message to a client.
struct Event {
    EventKind kind;
    std::string text;
};
