/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "ActorStore.hpp"

#include <map>
#include <mutex>

class InMemoryActorStore : public ActorStore {
    mutable std::mutex mutex_;
    std::map<ActorId, ActorRecord> actors_;

public:
    // Throws std::invalid_argument if the id is already taken.
    void add(ActorRecord actor);

    [[nodiscard]] std::vector<ActorRecord> all_active() const override;
    [[nodiscard]] std::vector<ActorRecord> in_room(RoomId room) const override;
    [[nodiscard]] std::optional<ActorRecord> find(ActorId id) const override;
    void update_state(ActorId id, const ActorState &state, Time last_cycle_run) override;
};
