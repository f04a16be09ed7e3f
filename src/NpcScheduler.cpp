/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "NpcScheduler.hpp"

#include "NpcBehaviour.hpp"

NpcScheduler::NpcScheduler(ActorStore &actors, Inventory &ground, const PresenceRegistry &presence,
                           const RoomBroadcaster &broadcaster, const MessageCatalogue &messages, Millis interval)
    : actors_(actors), ground_(ground), presence_(presence), broadcaster_(broadcaster), messages_(messages),
      interval_(interval), log_(logger_for("NpcScheduler")) {}

NpcScheduler::~NpcScheduler() { stop(); }

bool NpcScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true))
        return false;
    log_.info("Starting NPC cycles every {}ms", interval_.count());
    thread_ = std::thread([this] { run(); });
    return true;
}

void NpcScheduler::stop() {
    {
        std::lock_guard lock(wake_mutex_);
        running_.store(false);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        log_.info("Stopped NPC cycles after {} ticks", tick_count_.load());
    }
}

void NpcScheduler::run() {
    auto next_tick = std::chrono::steady_clock::now();
    while (running_.load()) {
        next_tick += interval_;
        try {
            const auto summary = tick(Clock::now());
            log_.trace("Tick {}: {} actors, {} cycled, {} failed", tick_count_.load(), summary.examined,
                       summary.cycled, summary.failed);
        } catch (const std::exception &e) {
            // Only the actor store listing can get here; individual actors are isolated inside tick().
            log_.error("NPC tick failed: {}", e.what());
        }

        const auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            // Overran: don't try to catch up.
            next_tick = now;
        }
        std::unique_lock lock(wake_mutex_);
        wake_.wait_until(lock, next_tick, [this] { return !running_.load(); });
    }
}

void NpcScheduler::request_harvest(std::string player, ActorId actor) {
    std::lock_guard lock(requests_mutex_);
    requests_.push_back(HarvestRequest{HarvestRequest::Kind::Start, std::move(player), actor});
}

void NpcScheduler::request_end_harvest(std::string player) {
    std::lock_guard lock(requests_mutex_);
    requests_.push_back(HarvestRequest{HarvestRequest::Kind::Stop, std::move(player), 0});
}

TickSummary NpcScheduler::tick(Time now) {
    ++tick_count_;
    apply_requests(now);

    TickSummary summary;
    for (auto &actor : actors_.all_active()) {
        ++summary.examined;
        try {
            expire_harvest(actor, now, summary);
            run_cycle(actor, now, summary);
        } catch (const std::exception &e) {
            ++summary.failed;
            log_.error("NPC {} (actor {}) failed its cycle: {}", actor.definition.name, actor.id, e.what());
        }
    }
    return summary;
}

void NpcScheduler::apply_requests(Time now) {
    std::vector<HarvestRequest> requests;
    {
        std::lock_guard lock(requests_mutex_);
        requests.swap(requests_);
    }
    for (const auto &request : requests) {
        try {
            if (request.kind == HarvestRequest::Kind::Start)
                start_harvest(request, now);
            else
                end_harvests_by(request.player, now);
        } catch (const std::exception &e) {
            log_.error("Unable to apply harvest request from {}: {}", request.player, e.what());
        }
    }
}

void NpcScheduler::start_harvest(const HarvestRequest &request, Time now) {
    auto actor = actors_.find(request.actor);
    if (!actor || !actor->active)
        return;
    const auto &npc = actor->definition.name;
    if (presence_.room_of(request.player) != actor->room) {
        // They walked away before the request was applied.
        log_.debug("{} left before harvesting {}", request.player, npc);
        return;
    }
    if (try_parse_npc_type(actor->definition.type) != NpcType::Rhythm) {
        tell(request.player, messages_.format("harvest_not_harvestable", fmt::arg("npc", npc)));
        return;
    }

    auto state = actor->state;
    if (state.harvest_active()) {
        const auto harvester = state.get_string(ActorState::HarvestingPlayer);
        tell(request.player, messages_.format(harvester == request.player ? "harvest_already_self"
                                                                           : "harvest_already_other",
                                              fmt::arg("npc", npc)));
        return;
    }
    const auto cooldown_until = state.get_int(ActorState::CooldownUntil);
    if (cooldown_until && epoch_millis(now) < *cooldown_until) {
        tell(request.player, messages_.format("harvest_cooldown"));
        return;
    }

    state.set(ActorState::HarvestActive, true);
    state.set(ActorState::HarvestStartTime, epoch_millis(now));
    state.set(ActorState::HarvestingPlayer, request.player);
    state.erase(ActorState::CooldownUntil);
    actors_.update_state(actor->id, state, actor->last_cycle_run);
    log_.info("{} started harvesting {} (actor {})", request.player, npc, actor->id);
    tell(request.player, messages_.format("harvest_begin", fmt::arg("npc", npc)));
}

void NpcScheduler::end_harvests_by(const std::string &player, Time now) {
    for (auto &actor : actors_.all_active()) {
        if (actor.state.harvest_active() && actor.state.get_string(ActorState::HarvestingPlayer) == player)
            end_harvest(actor, now, "harvest_interrupted");
    }
}

void NpcScheduler::end_harvest(ActorRecord &actor, Time now, std::string_view message_key) {
    auto &state = actor.state;
    const auto player = state.get_string(ActorState::HarvestingPlayer);
    state.set(ActorState::HarvestActive, false);
    state.erase(ActorState::HarvestStartTime);
    state.erase(ActorState::HarvestingPlayer);
    state.set(ActorState::CooldownUntil, epoch_millis(now + actor.definition.cooldown_time));
    // Ending a session isn't a cycle, so the cycle timestamp is left alone.
    actors_.update_state(actor.id, state, actor.last_cycle_run);
    log_.debug("Harvest of {} (actor {}) ended", actor.definition.name, actor.id);
    if (player)
        tell(*player, messages_.format(message_key, fmt::arg("npc", actor.definition.name)));
}

void NpcScheduler::expire_harvest(ActorRecord &actor, Time now, TickSummary &summary) {
    if (!actor.state.harvest_active())
        return;
    const auto started = actor.state.get_int(ActorState::HarvestStartTime).value_or(epoch_millis(now));
    if (epoch_millis(now) - started < actor.definition.harvestable_time.count())
        return;
    end_harvest(actor, now, "harvest_ended");
    ++summary.harvests_ended;
}

void NpcScheduler::run_cycle(ActorRecord &actor, Time now, TickSummary &summary) {
    if (now - actor.last_cycle_run < actor.definition.base_cycle_time)
        return;
    if (!try_parse_npc_type(actor.definition.type))
        log_.debug("Actor {} has unknown type '{}'; counting cycles only", actor.id, actor.definition.type);

    auto result = behaviour_for(actor.definition.type).advance(actor.state, actor.definition);
    actors_.update_state(actor.id, result.state, now);
    actor.state = std::move(result.state);
    actor.last_cycle_run = now;
    ++summary.cycled;

    for (const auto &item : result.produced) {
        ground_.add_item(actor.room, item.name, item.quantity);
        summary.items_produced += static_cast<size_t>(item.quantity);
        broadcaster_.broadcast(actor.room, Event{EventKind::Message,
                                                 messages_.format("harvest_item_produced",
                                                                  fmt::arg("npc", actor.definition.name),
                                                                  fmt::arg("quantity", item.quantity),
                                                                  fmt::arg("item", item.name))});
    }
}

void NpcScheduler::tell(const std::string &player, std::string text) const {
    if (auto connection = presence_.connection_of(player)) {
        if (!connection->send(Event{EventKind::Message, std::move(text)}))
            log_.debug("Unable to tell {} about their harvest", player);
    }
}
