#pragma once

#include "ChannelConnection.hpp"
#include "LineSplitter.hpp"
#include "common/Fd.hpp"
#include "common/Logger.hpp"
#include "common/Time.hpp"

#include <memory>
#include <netinet/in.h>
#include <string>
#include <sys/select.h>

class Game;
class Server;
using SessionId = uint32_t;

// One connected client socket.
class Channel {
    mutable Logger log_;

    Server &server_;
    Game &game_;
    SessionId id_;
    Fd fd_;
    std::string address_;
    LineSplitter lines_;
    std::shared_ptr<ChannelConnection> connection_;
    // Output the socket has not yet accepted.
    std::string unsent_;

    void on_data_available(Time now);
    void flush_output();

public:
    Channel(Server &server, Game &game, SessionId id, Fd fd, const sockaddr_in &address);

    Channel(const Channel &) = delete;
    Channel(Channel &&) = delete;
    Channel &operator=(const Channel &) = delete;
    Channel &operator=(Channel &&) = delete;

    [[nodiscard]] SessionId id() const noexcept { return id_; }
    [[nodiscard]] bool is_closed() const noexcept { return !fd_.is_open(); }
    void close();

    [[nodiscard]] int set_fds(fd_set &input_fds, fd_set &output_fds, fd_set &exception_fds) const noexcept;
    void check_fds(const fd_set &input_fds, const fd_set &output_fds, const fd_set &exception_fds, Time now);
    // Moves queued events towards the socket. Called after every poll.
    void flush();
};
