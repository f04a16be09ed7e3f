/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Game.hpp"

#include "ArgParser.hpp"
#include "NpcBehaviour.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>

// Checks what it can against a snapshot, then leaves the state change itself to the scheduler.
void Game::do_harvest(Session &session, ArgParser &args, Time now) {
    const auto &identity = *session.identity;
    const auto *room = current_room(identity);
    const auto target = trim(args.remaining());
    if (!room)
        return;
    if (target.empty()) {
        send(session, EventKind::Error, "Harvest what?");
        return;
    }

    const auto found = matching_actors(room->id, target);
    if (found.empty()) {
        send(session, EventKind::Error, world_.messages.format("look_not_here", fmt::arg("target", target)));
        return;
    }
    std::vector<std::string> names;
    for (const auto &actor : found)
        if (std::find(names.begin(), names.end(), actor.definition.name) == names.end())
            names.push_back(actor.definition.name);
    if (names.size() > 1) {
        send(session, EventKind::Message, world_.messages.format("look_which", fmt::arg("choices", join(names, ", "))));
        return;
    }

    const auto &actor = found.front();
    const auto &npc = actor.definition.name;
    if (try_parse_npc_type(actor.definition.type) != NpcType::Rhythm) {
        send(session, EventKind::Error, world_.messages.format("harvest_not_harvestable", fmt::arg("npc", npc)));
        return;
    }
    const auto cooldown_until = actor.state.get_int(ActorState::CooldownUntil);
    if (cooldown_until && epoch_millis(now) < *cooldown_until) {
        send(session, EventKind::Error, world_.messages.format("harvest_cooldown"));
        return;
    }
    scheduler_.request_harvest(identity, actor.id);
}
