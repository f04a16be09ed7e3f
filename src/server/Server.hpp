#pragma once

#include "Channel.hpp"
#include "common/Fd.hpp"
#include "common/Logger.hpp"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

class Game;

// Accepts client connections and shuttles lines between them and the game.
class Server {
    mutable Logger log_;
    Fd listen_sock_;
    uint16_t port_;
    size_t max_channels_;
    Game &game_;
    SessionId next_id_{1};
    std::unordered_map<SessionId, std::unique_ptr<Channel>> channels_;
    std::vector<SessionId> channels_to_remove_;

    void socket_poll(Time now);
    void accept_new_connection();
    void remove_dead_channels();

public:
    Server(Game &game, uint16_t port, size_t max_channels);
    ~Server();
    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // One pass of the network loop: waits briefly for traffic, handles it, then runs due guided steps.
    void poll();
    void schedule_remove(const Channel &channel) { channels_to_remove_.emplace_back(channel.id()); }
    [[nodiscard]] size_t channel_count() const noexcept { return channels_.size(); }
};
