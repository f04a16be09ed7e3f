/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Actor.hpp"

#include <optional>
#include <string_view>
#include <vector>

// The closed set of NPC types understood by the scheduler.
enum class NpcType {
    Rhythm,
    Stability,
    Worker,
    Tending,
    Rotation,
    Economic,
    Farm,
    Patrol,
    Threshold,
    Machine,
    LoreKeeper
};

struct CycleResult {
    ActorState state;
    std::vector<ItemStack> produced;
};

// Advances one NPC by one cycle. Behaviours are stateless and shared.
class NpcBehaviour {
public:
    virtual ~NpcBehaviour() = default;
    [[nodiscard]] virtual CycleResult advance(ActorState state, const NpcDefinition &definition) const = 0;
};

// Case insensitive, e.g. "lorekeeper" or "RHYTHM".
[[nodiscard]] std::optional<NpcType> try_parse_npc_type(std::string_view tag);

[[nodiscard]] const NpcBehaviour &behaviour_for(NpcType type);
// An unrecognised tag gets the counting behaviour that produces nothing.
[[nodiscard]] const NpcBehaviour &behaviour_for(std::string_view tag);
