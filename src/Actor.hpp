/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "ActorState.hpp"
#include "Room.hpp"
#include "common/Time.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

using ActorId = uint32_t;
using NpcDefinitionId = uint32_t;

struct ItemStack {
    std::string name;
    int quantity{};

    bool operator==(const ItemStack &) const = default;
};

// Overrides for the status shown after an NPC's name in room listings.
struct StatusTexts {
    std::optional<std::string> idle;
    std::optional<std::string> ready;
    std::optional<std::string> harvesting;
    std::optional<std::string> cooldown;
};

struct NpcDefinition {
    NpcDefinitionId id{};
    std::string name;
    std::string description;
    std::string type;
    Millis base_cycle_time{12000};
    Millis harvestable_time{60000};
    Millis cooldown_time{120000};
    std::map<std::string, int> output_items;
    StatusTexts status_texts;
};

// A placed NPC together with its definition, ready for the scheduler.
struct ActorRecord {
    ActorId id{};
    RoomId room{};
    int slot{};
    bool active{true};
    ActorState state;
    Time last_cycle_run{};
    NpcDefinition definition;
};

enum class ActorStatus { Idle, Harvesting, Cooldown, Ready };

[[nodiscard]] ActorStatus status_of(const ActorRecord &actor, Time now);
// The status as shown to players, e.g. "(ready)", honouring the definition's overrides.
[[nodiscard]] std::string status_text(const ActorRecord &actor, Time now);
