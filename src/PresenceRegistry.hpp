/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Connection.hpp"
#include "Room.hpp"
#include "TopologyStore.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

enum class PresenceResult { Added, Duplicate, UnknownRoom };

// Who is online and where. One entry per player identity; shared between connection handling and the scheduler,
// so every operation takes the registry lock for the duration of a single map update.
class PresenceRegistry {
    struct Entry {
        std::shared_ptr<Connection> connection;
        RoomId room;
    };

    const TopologyStore &topology_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

public:
    explicit PresenceRegistry(const TopologyStore &topology) : topology_(topology) {}
    PresenceRegistry(const PresenceRegistry &) = delete;
    PresenceRegistry &operator=(const PresenceRegistry &) = delete;

    // Fails without touching the existing entry if the identity is already present.
    [[nodiscard]] PresenceResult add(const std::string &identity, std::shared_ptr<Connection> connection, RoomId room);
    // Returns the room the identity was in, if it was present.
    std::optional<RoomId> remove(const std::string &identity);
    // Returns false if the identity isn't present or the room doesn't exist.
    [[nodiscard]] bool move_to(const std::string &identity, RoomId room);

    [[nodiscard]] std::optional<RoomId> room_of(const std::string &identity) const;
    [[nodiscard]] std::shared_ptr<Connection> connection_of(const std::string &identity) const;
    // Names of those in the room, sorted.
    [[nodiscard]] std::vector<std::string> occupants_of(RoomId room,
                                                        std::optional<std::string_view> excluding = {}) const;
    [[nodiscard]] std::vector<std::shared_ptr<Connection>>
    connections_in(RoomId room, std::optional<std::string_view> excluding = {}) const;
    [[nodiscard]] size_t size() const;
};
