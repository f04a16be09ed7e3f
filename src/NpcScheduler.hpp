/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "ActorStore.hpp"
#include "Inventory.hpp"
#include "MessageCatalogue.hpp"
#include "PresenceRegistry.hpp"
#include "RoomBroadcaster.hpp"
#include "common/Logger.hpp"
#include "common/Time.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct HarvestRequest {
    enum class Kind { Start, Stop };
    Kind kind;
    std::string player;
    // Only meaningful when starting.
    ActorId actor{};
};

struct TickSummary {
    size_t examined{};
    size_t cycled{};
    size_t failed{};
    size_t items_produced{};
    size_t harvests_ended{};
};

// Advances every active NPC on a fixed interval, independently of any connection. It is the only writer of actor
// state: player-initiated harvest changes are queued and applied at the start of the next tick.
class NpcScheduler {
    ActorStore &actors_;
    Inventory &ground_;
    const PresenceRegistry &presence_;
    const RoomBroadcaster &broadcaster_;
    const MessageCatalogue &messages_;
    Millis interval_;
    mutable Logger log_;

    std::mutex requests_mutex_;
    std::vector<HarvestRequest> requests_;

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tick_count_{0};
    std::thread thread_;

    void run();
    void apply_requests(Time now);
    void start_harvest(const HarvestRequest &request, Time now);
    void end_harvests_by(const std::string &player, Time now);
    void end_harvest(ActorRecord &actor, Time now, std::string_view message_key);
    void expire_harvest(ActorRecord &actor, Time now, TickSummary &summary);
    void run_cycle(ActorRecord &actor, Time now, TickSummary &summary);
    void tell(const std::string &player, std::string text) const;

public:
    NpcScheduler(ActorStore &actors, Inventory &ground, const PresenceRegistry &presence,
                 const RoomBroadcaster &broadcaster, const MessageCatalogue &messages, Millis interval);
    ~NpcScheduler();
    NpcScheduler(const NpcScheduler &) = delete;
    NpcScheduler &operator=(const NpcScheduler &) = delete;
    NpcScheduler(NpcScheduler &&) = delete;
    NpcScheduler &operator=(NpcScheduler &&) = delete;

    // One sweep over all active actors. Called by the background thread, or directly by tests.
    TickSummary tick(Time now);

    void request_harvest(std::string player, ActorId actor);
    void request_end_harvest(std::string player);

    // Starts the background thread. Returns false if it was already running.
    [[nodiscard]] bool start();
    // Wakes and joins the background thread. Safe to call more than once.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t tick_count() const noexcept { return tick_count_.load(); }
    [[nodiscard]] Millis interval() const noexcept { return interval_; }
};
