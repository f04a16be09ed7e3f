/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Actor.hpp"

ActorStatus status_of(const ActorRecord &actor, Time now) {
    const auto &state = actor.state;
    if (state.cycles() == 0)
        return ActorStatus::Idle;
    if (state.harvest_active())
        return ActorStatus::Harvesting;
    const auto cooldown_until = state.get_int(ActorState::CooldownUntil);
    if (cooldown_until && epoch_millis(now) < *cooldown_until)
        return ActorStatus::Cooldown;
    return ActorStatus::Ready;
}

std::string status_text(const ActorRecord &actor, Time now) {
    const auto &texts = actor.definition.status_texts;
    switch (status_of(actor, now)) {
    case ActorStatus::Idle: return texts.idle.value_or("(idle)");
    case ActorStatus::Harvesting: return texts.harvesting.value_or("(harvesting)");
    case ActorStatus::Cooldown: return texts.cooldown.value_or("(cooldown)");
    case ActorStatus::Ready: return texts.ready.value_or("(ready)");
    }
    return {};
}
