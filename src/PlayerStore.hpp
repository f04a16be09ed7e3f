/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Room.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

struct PlayerRecord {
    std::string name;
    RoomId room{};
};

// Persistent player records: just enough to put a returning player back where they left.
struct PlayerStore {
    virtual ~PlayerStore() = default;

    // Case insensitive.
    [[nodiscard]] virtual std::optional<PlayerRecord> find(std::string_view name) const = 0;
    // Returns false for an unknown player.
    virtual bool save_room(std::string_view name, RoomId room) = 0;
};

class InMemoryPlayerStore : public PlayerStore {
    mutable std::mutex mutex_;
    // Keyed by lower case name.
    std::map<std::string, PlayerRecord, std::less<>> players_;

public:
    // Throws std::invalid_argument for a name that is already taken.
    void add(PlayerRecord record);

    [[nodiscard]] std::optional<PlayerRecord> find(std::string_view name) const override;
    bool save_room(std::string_view name, RoomId room) override;
};
