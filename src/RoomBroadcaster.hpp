/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Event.hpp"
#include "PresenceRegistry.hpp"
#include "common/Logger.hpp"

#include <optional>
#include <string_view>

// Fans an event out to everyone in a room. Delivery is best effort: a recipient that cannot take the event is
// skipped, and the rest still receive it.
class RoomBroadcaster {
    const PresenceRegistry &presence_;
    mutable Logger log_;

public:
    explicit RoomBroadcaster(const PresenceRegistry &presence);

    // Returns the number of recipients the event was handed to.
    size_t broadcast(RoomId room, const Event &event, std::optional<std::string_view> excluding = {}) const;
};
