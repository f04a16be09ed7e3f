/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "PlayerStore.hpp"

#include "string_utils.hpp"

#include <fmt/format.h>

#include <stdexcept>

void InMemoryPlayerStore::add(PlayerRecord record) {
    std::lock_guard lock(mutex_);
    auto key = lower_case(record.name);
    if (players_.contains(key))
        throw std::invalid_argument(fmt::format("Duplicate player {}", record.name));
    players_.emplace(std::move(key), std::move(record));
}

std::optional<PlayerRecord> InMemoryPlayerStore::find(std::string_view name) const {
    std::lock_guard lock(mutex_);
    if (auto it = players_.find(lower_case(name)); it != players_.end())
        return it->second;
    return {};
}

bool InMemoryPlayerStore::save_room(std::string_view name, RoomId room) {
    std::lock_guard lock(mutex_);
    auto it = players_.find(lower_case(name));
    if (it == players_.end())
        return false;
    it->second.room = room;
    return true;
}
