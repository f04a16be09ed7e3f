/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "InMemoryActorStore.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

void InMemoryActorStore::add(ActorRecord actor) {
    std::lock_guard lock(mutex_);
    const auto id = actor.id;
    if (!actors_.try_emplace(id, std::move(actor)).second)
        throw std::invalid_argument(fmt::format("Duplicate actor id {}", id));
}

std::vector<ActorRecord> InMemoryActorStore::all_active() const {
    std::lock_guard lock(mutex_);
    std::vector<ActorRecord> result;
    for (const auto &[id, actor] : actors_)
        if (actor.active)
            result.push_back(actor);
    return result;
}

std::vector<ActorRecord> InMemoryActorStore::in_room(RoomId room) const {
    std::vector<ActorRecord> result;
    {
        std::lock_guard lock(mutex_);
        for (const auto &[id, actor] : actors_)
            if (actor.active && actor.room == room)
                result.push_back(actor);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const ActorRecord &lhs, const ActorRecord &rhs) { return lhs.slot < rhs.slot; });
    return result;
}

std::optional<ActorRecord> InMemoryActorStore::find(ActorId id) const {
    std::lock_guard lock(mutex_);
    if (auto it = actors_.find(id); it != actors_.end())
        return it->second;
    return {};
}

void InMemoryActorStore::update_state(ActorId id, const ActorState &state, Time last_cycle_run) {
    std::lock_guard lock(mutex_);
    auto it = actors_.find(id);
    if (it == actors_.end())
        throw std::out_of_range(fmt::format("No actor with id {}", id));
    it->second.state = state;
    it->second.last_cycle_run = last_cycle_run;
}
