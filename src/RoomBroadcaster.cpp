/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "RoomBroadcaster.hpp"

#include <magic_enum.hpp>

RoomBroadcaster::RoomBroadcaster(const PresenceRegistry &presence)
    : presence_(presence), log_(logger_for("Broadcast")) {}

size_t RoomBroadcaster::broadcast(RoomId room, const Event &event, std::optional<std::string_view> excluding) const {
    // Recipients are snapshotted under the registry lock; sending happens outside it.
    const auto recipients = presence_.connections_in(room, excluding);
    size_t delivered = 0;
    for (const auto &connection : recipients) {
        try {
            if (connection && connection->send(event))
                ++delivered;
        } catch (const std::exception &e) {
            log_.debug("Error while broadcasting to room {}: {}", room, e.what());
        }
    }
    if (delivered != recipients.size())
        log_.debug("Dropped {} event for {} of {} in room {}", magic_enum::enum_name(event.kind),
                   recipients.size() - delivered, recipients.size(), room);
    return delivered;
}
