#include "NpcScheduler.hpp"
#include "GroundInventory.hpp"
#include "InMemoryActorStore.hpp"
#include "MockConnection.hpp"
#include "TestWorld.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <thread>

using namespace test;
using namespace std::literals;

namespace {

const auto t0 = from_epoch_millis(1'700'000'000'000);

ActorRecord make_actor(ActorId id, RoomId room, std::string type) {
    ActorRecord actor;
    actor.id = id;
    actor.room = room;
    actor.slot = static_cast<int>(id);
    actor.last_cycle_run = t0;
    actor.definition.id = id;
    actor.definition.name = "Pulsewood Harvester";
    actor.definition.type = std::move(type);
    actor.definition.base_cycle_time = 12s;
    actor.definition.harvestable_time = 60s;
    actor.definition.cooldown_time = 120s;
    actor.definition.output_items = {{"pulse shard", 2}};
    return actor;
}

// Ground that refuses to take anything in one room.
class FailingInventory : public Inventory {
    GroundInventory inner_;
    ContainerId broken_;

public:
    explicit FailingInventory(ContainerId broken) : broken_(broken) {}
    void add_item(ContainerId container, std::string_view item, int quantity) override {
        if (container == broken_)
            throw std::runtime_error("floor is lava");
        inner_.add_item(container, item, quantity);
    }
    std::vector<ItemStack> items_in(ContainerId container) const override { return inner_.items_in(container); }
};

struct SchedulerFixture {
    Topology topology;
    PresenceRegistry presence{topology};
    RoomBroadcaster broadcaster{presence};
    MessageCatalogue messages;
    InMemoryActorStore actors;
    GroundInventory ground;
    std::shared_ptr<RecordingConnection> aria = std::make_shared<RecordingConnection>();
    std::shared_ptr<RecordingConnection> bram = std::make_shared<RecordingConnection>();

    SchedulerFixture() {
        topology.add_map(make_map(1, "Meadow"));
        add_grid(topology, 1, 2, 1, 1);
    }

    ActorRecord actor(ActorId id) const { return *actors.find(id); }
};

}

TEST_CASE_METHOD(SchedulerFixture, "NPC cycles") {
    NpcScheduler scheduler(actors, ground, presence, broadcaster, messages, 1000ms);
    actors.add(make_actor(1, 1, "rhythm"));

    SECTION("should leave actors alone until their cycle is due") {
        const auto before = actor(1);
        for (int i = 0; i < 3; ++i) {
            const auto summary = scheduler.tick(t0 + 11999ms);
            CHECK(summary.examined == 1);
            CHECK(summary.cycled == 0);
        }
        CHECK(actor(1).state == before.state);
        CHECK(actor(1).last_cycle_run == t0);
    }
    SECTION("should cycle once the time has come") {
        const auto summary = scheduler.tick(t0 + 12s);
        CHECK(summary.cycled == 1);
        CHECK(actor(1).state.cycles() == 1);
        CHECK(actor(1).last_cycle_run == t0 + 12s);
        SECTION("and wait a full cycle before the next") {
            CHECK(scheduler.tick(t0 + 23s).cycled == 0);
            CHECK(scheduler.tick(t0 + 24s).cycled == 1);
            CHECK(actor(1).state.cycles() == 2);
        }
    }
    SECTION("should cycle with nobody around") {
        CHECK(presence.size() == 0);
        CHECK(scheduler.tick(t0 + 12s).cycled == 1);
    }
    SECTION("should produce nothing without a harvest") {
        CHECK(scheduler.tick(t0 + 12s).items_produced == 0);
        CHECK(ground.items_in(1).empty());
    }
    SECTION("should skip inactive actors") {
        auto dormant = make_actor(2, 2, "rhythm");
        dormant.active = false;
        actors.add(dormant);
        CHECK(scheduler.tick(t0 + 12s).examined == 1);
        CHECK(actor(2).state.cycles() == 0);
    }
    SECTION("should count cycles for unknown types") {
        actors.add(make_actor(2, 2, "dragon"));
        CHECK(scheduler.tick(t0 + 12s).cycled == 2);
        CHECK(actor(2).state.cycles() == 1);
    }
}

TEST_CASE_METHOD(SchedulerFixture, "Failures are isolated per actor") {
    FailingInventory broken_ground(1);
    NpcScheduler scheduler(actors, broken_ground, presence, broadcaster, messages, 1000ms);
    for (ActorId id : {1u, 2u}) {
        auto harvested = make_actor(id, id, "rhythm");
        harvested.state.set(ActorState::HarvestActive, true);
        harvested.state.set(ActorState::HarvestStartTime, epoch_millis(t0));
        actors.add(harvested);
    }

    const auto summary = scheduler.tick(t0 + 12s);
    CHECK(summary.examined == 2);
    CHECK(summary.failed == 1);
    CHECK(summary.items_produced == 2);
    CHECK(broken_ground.items_in(2) == std::vector<ItemStack>{{"pulse shard", 2}});
    CHECK(actor(2).state.cycles() == 1);
}

TEST_CASE_METHOD(SchedulerFixture, "Harvesting") {
    NpcScheduler scheduler(actors, ground, presence, broadcaster, messages, 1000ms);
    actors.add(make_actor(1, 1, "rhythm"));
    REQUIRE(presence.add("Aria", aria, 1) == PresenceResult::Added);
    REQUIRE(presence.add("Bram", bram, 1) == PresenceResult::Added);

    SECTION("should only start on the next tick") {
        scheduler.request_harvest("Aria", 1);
        CHECK(!actor(1).state.harvest_active());
        scheduler.tick(t0 + 1s);
        CHECK(actor(1).state.harvest_active());
        CHECK(actor(1).state.get_string(ActorState::HarvestingPlayer) == "Aria"s);
        CHECK(actor(1).state.get_int(ActorState::HarvestStartTime) == epoch_millis(t0 + 1s));
        CHECK(aria->last(EventKind::Message) == "You begin harvesting the Pulsewood Harvester.");
        // Starting isn't a cycle.
        CHECK(actor(1).last_cycle_run == t0);
    }
    SECTION("should run a whole session") {
        scheduler.request_harvest("Aria", 1);
        scheduler.tick(t0 + 1s);

        const auto producing = scheduler.tick(t0 + 12s);
        CHECK(producing.items_produced == 2);
        CHECK(ground.items_in(1) == std::vector<ItemStack>{{"pulse shard", 2}});
        CHECK(aria->received("Pulsewood Harvester pulses 2 pulse shard for harvest."));
        CHECK(bram->received("Pulsewood Harvester pulses 2 pulse shard for harvest."));

        scheduler.tick(t0 + 24s);
        CHECK(ground.items_in(1) == std::vector<ItemStack>{{"pulse shard", 4}});

        const auto ending = scheduler.tick(t0 + 61s);
        CHECK(ending.harvests_ended == 1);
        CHECK(ending.items_produced == 0);
        CHECK(!actor(1).state.harvest_active());
        CHECK(!actor(1).state.has(ActorState::HarvestingPlayer));
        CHECK(actor(1).state.get_int(ActorState::CooldownUntil) == epoch_millis(t0 + 181s));
        CHECK(aria->received("The harvest has ended"));
        CHECK(status_of(actor(1), t0 + 62s) == ActorStatus::Cooldown);

        SECTION("then refuse until the cooldown is over") {
            scheduler.request_harvest("Aria", 1);
            scheduler.tick(t0 + 62s);
            CHECK(!actor(1).state.harvest_active());
            CHECK(aria->last(EventKind::Message) == "This creature is not currently capable of harvest.");

            scheduler.request_harvest("Bram", 1);
            scheduler.tick(t0 + 181s);
            CHECK(actor(1).state.harvest_active());
            CHECK(!actor(1).state.has(ActorState::CooldownUntil));
        }
    }
    SECTION("should allow one harvester at a time") {
        scheduler.request_harvest("Aria", 1);
        scheduler.request_harvest("Bram", 1);
        scheduler.request_harvest("Aria", 1);
        scheduler.tick(t0 + 1s);
        CHECK(actor(1).state.get_string(ActorState::HarvestingPlayer) == "Aria"s);
        CHECK(bram->last(EventKind::Message) == "Someone is already harvesting the Pulsewood Harvester.");
        CHECK(aria->last(EventKind::Message) == "You are already harvesting the Pulsewood Harvester.");
    }
    SECTION("should end when the harvester leaves") {
        scheduler.request_harvest("Aria", 1);
        scheduler.tick(t0 + 1s);
        scheduler.request_end_harvest("Aria");
        scheduler.tick(t0 + 2s);
        CHECK(!actor(1).state.harvest_active());
        CHECK(actor(1).state.get_int(ActorState::CooldownUntil) == epoch_millis(t0 + 122s));
        CHECK(aria->last(EventKind::Message) == "Your harvesting has been interrupted.");
    }
    SECTION("should ignore ending a harvest that isn't running") {
        scheduler.request_end_harvest("Bram");
        scheduler.tick(t0 + 1s);
        CHECK(!actor(1).state.has(ActorState::CooldownUntil));
    }
    SECTION("should not start for someone who has walked away") {
        scheduler.request_harvest("Aria", 1);
        REQUIRE(presence.move_to("Aria", 2));
        scheduler.tick(t0 + 1s);
        CHECK(!actor(1).state.harvest_active());
    }
    SECTION("should refuse NPCs that can't be harvested") {
        auto farmer = make_actor(2, 1, "farm");
        farmer.definition.name = "Old Farmer";
        actors.add(farmer);
        scheduler.request_harvest("Aria", 2);
        scheduler.tick(t0 + 1s);
        CHECK(!actor(2).state.harvest_active());
        CHECK(aria->last(EventKind::Message) == "You can't harvest the Old Farmer.");
    }
    SECTION("should use the world's own wording") {
        messages.set_template("harvest_begin", "You lay hands on the {npc}.");
        scheduler.request_harvest("Aria", 1);
        scheduler.tick(t0 + 1s);
        CHECK(aria->last(EventKind::Message) == "You lay hands on the Pulsewood Harvester.");
    }
}

TEST_CASE_METHOD(SchedulerFixture, "Scheduler thread") {
    actors.add(make_actor(1, 1, "rhythm"));
    NpcScheduler scheduler(actors, ground, presence, broadcaster, messages, 5ms);
    CHECK(!scheduler.is_running());
    REQUIRE(scheduler.start());
    CHECK(!scheduler.start());
    CHECK(scheduler.is_running());
    for (int i = 0; i < 400 && scheduler.tick_count() < 2; ++i)
        std::this_thread::sleep_for(5ms);
    CHECK(scheduler.tick_count() >= 2);
    scheduler.stop();
    CHECK(!scheduler.is_running());
    const auto ticks = scheduler.tick_count();
    std::this_thread::sleep_for(20ms);
    CHECK(scheduler.tick_count() == ticks);
    scheduler.stop();
}
