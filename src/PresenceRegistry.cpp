/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "PresenceRegistry.hpp"

#include <algorithm>

PresenceResult PresenceRegistry::add(const std::string &identity, std::shared_ptr<Connection> connection,
                                     RoomId room) {
    if (!topology_.room_by_id(room))
        return PresenceResult::UnknownRoom;
    std::lock_guard lock(mutex_);
    const auto [it, inserted] = entries_.try_emplace(identity, Entry{std::move(connection), room});
    return inserted ? PresenceResult::Added : PresenceResult::Duplicate;
}

std::optional<RoomId> PresenceRegistry::remove(const std::string &identity) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end())
        return {};
    const auto room = it->second.room;
    entries_.erase(it);
    return room;
}

bool PresenceRegistry::move_to(const std::string &identity, RoomId room) {
    if (!topology_.room_by_id(room))
        return false;
    std::lock_guard lock(mutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end())
        return false;
    it->second.room = room;
    return true;
}

std::optional<RoomId> PresenceRegistry::room_of(const std::string &identity) const {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(identity); it != entries_.end())
        return it->second.room;
    return {};
}

std::shared_ptr<Connection> PresenceRegistry::connection_of(const std::string &identity) const {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(identity); it != entries_.end())
        return it->second.connection;
    return nullptr;
}

std::vector<std::string> PresenceRegistry::occupants_of(RoomId room, std::optional<std::string_view> excluding) const {
    std::vector<std::string> result;
    {
        std::lock_guard lock(mutex_);
        for (const auto &[identity, entry] : entries_)
            if (entry.room == room && identity != excluding)
                result.push_back(identity);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::shared_ptr<Connection>>
PresenceRegistry::connections_in(RoomId room, std::optional<std::string_view> excluding) const {
    std::vector<std::shared_ptr<Connection>> result;
    std::lock_guard lock(mutex_);
    for (const auto &[identity, entry] : entries_)
        if (entry.room == room && identity != excluding)
            result.push_back(entry.connection);
    return result;
}

size_t PresenceRegistry::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}
