/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Actor.hpp"

#include <optional>
#include <vector>

// Persistent placed NPCs. Reads return copies, so callers never see a half-applied update.
struct ActorStore {
    virtual ~ActorStore() = default;

    [[nodiscard]] virtual std::vector<ActorRecord> all_active() const = 0;
    // Ordered by slot.
    [[nodiscard]] virtual std::vector<ActorRecord> in_room(RoomId room) const = 0;
    [[nodiscard]] virtual std::optional<ActorRecord> find(ActorId id) const = 0;
    // Throws std::out_of_range for an unknown actor.
    virtual void update_state(ActorId id, const ActorState &state, Time last_cycle_run) = 0;
};
