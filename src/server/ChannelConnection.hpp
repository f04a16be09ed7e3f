#pragma once

#include "Connection.hpp"

#include <atomic>
#include <mutex>
#include <string>

// The Connection handed to the game for one client. Events are queued here from any thread and written out by the
// network loop, so a slow client never holds anyone up. A client that lets too much pile up is cut off.
class ChannelConnection : public Connection {
    mutable std::mutex mutex_;
    std::string pending_;
    std::atomic<bool> open_{true};

public:
    static constexpr size_t MaxPendingOutput = 32000;

    [[nodiscard]] bool send(const Event &event) override;
    [[nodiscard]] bool is_open() const override { return open_.load(); }
    void close() noexcept { open_.store(false); }

    // Takes everything queued so far.
    [[nodiscard]] std::string take_pending();
    [[nodiscard]] bool has_pending() const;
};
