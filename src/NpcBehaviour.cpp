/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "NpcBehaviour.hpp"

#include "string_utils.hpp"

#include <magic_enum.hpp>

namespace {

// Counts cycles and produces its output only while a harvest session is running. The session keys belong to the
// harvest logic, so they are carried through untouched.
class RhythmBehaviour : public NpcBehaviour {
public:
    CycleResult advance(ActorState state, const NpcDefinition &definition) const override {
        CycleResult result;
        const bool harvesting = state.harvest_active();
        state.cycles(state.cycles() + 1);
        result.state = std::move(state);
        if (harvesting) {
            for (const auto &[item, quantity] : definition.output_items)
                if (quantity > 0)
                    result.produced.push_back(ItemStack{item, quantity});
        }
        return result;
    }
};

// Types whose scripts aren't modelled yet: they just count cycles. Also used for unknown types.
class CountingBehaviour : public NpcBehaviour {
public:
    CycleResult advance(ActorState state, const NpcDefinition &) const override {
        state.cycles(state.cycles() + 1);
        return CycleResult{std::move(state), {}};
    }
};

// Lore keepers only talk; their state never changes on a cycle.
class NarrativeBehaviour : public NpcBehaviour {
public:
    CycleResult advance(ActorState state, const NpcDefinition &) const override {
        return CycleResult{std::move(state), {}};
    }
};

RhythmBehaviour rhythm;
CountingBehaviour counting;
NarrativeBehaviour narrative;

}

std::optional<NpcType> try_parse_npc_type(std::string_view tag) {
    tag = trim(tag);
    for (auto type : magic_enum::enum_values<NpcType>())
        if (matches(tag, magic_enum::enum_name(type)))
            return type;
    return {};
}

const NpcBehaviour &behaviour_for(NpcType type) {
    switch (type) {
    case NpcType::Rhythm: return rhythm;
    case NpcType::LoreKeeper: return narrative;
    case NpcType::Stability:
    case NpcType::Worker:
    case NpcType::Tending:
    case NpcType::Rotation:
    case NpcType::Economic:
    case NpcType::Farm:
    case NpcType::Patrol:
    case NpcType::Threshold:
    case NpcType::Machine: break;
    }
    return counting;
}

const NpcBehaviour &behaviour_for(std::string_view tag) {
    if (auto type = try_parse_npc_type(tag))
        return behaviour_for(*type);
    return counting;
}
