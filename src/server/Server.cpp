#include "Server.hpp"

#include "Game.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <string_view>
#include <sys/select.h>

using namespace std::literals;

Server::Server(Game &game, uint16_t port, size_t max_channels)
    : log_(logger_for("Server")), port_(port), max_channels_(max_channels), game_(game) {
    log_.info("Attempting to bind to port {}", port);
    listen_sock_ = Fd::socket(PF_INET, SOCK_STREAM, IPPROTO_TCP);

    sockaddr_in sin{};
    memset(&sin, 0, sizeof(sin));
    sin.sin_family = PF_INET;
    sin.sin_port = htons(port);
    sin.sin_addr.s_addr = htonl(INADDR_ANY);
    listen_sock_.setsockopt(SOL_SOCKET, SO_REUSEADDR, static_cast<int>(1))
        .setsockopt(SOL_SOCKET, SO_LINGER, linger{true, 2})
        .bind(sin)
        .listen(16);

    log_.info("Newhaven is listening on port {}", port);
}

Server::~Server() {
    for (auto &[id, channel] : channels_)
        channel->close();
    channels_to_remove_.clear();
}

void Server::poll() {
    socket_poll(Clock::now());
    for (auto &[id, channel] : channels_)
        channel->flush();
    remove_dead_channels();
    game_.pump(Clock::now());
    // Guided steps queue output too; send it now rather than on the next pass.
    for (auto &[id, channel] : channels_)
        channel->flush();
    remove_dead_channels();
}

void Server::remove_dead_channels() {
    // Channels close themselves from inside their own calls, so removal waits until nothing of theirs is on the
    // stack.
    for (auto id : channels_to_remove_) {
        log_.debug("Removed channel {}", id);
        channels_.erase(id);
    }
    channels_to_remove_.clear();
}

void Server::socket_poll(Time now) {
    fd_set input_fds, output_fds, exception_fds;
    FD_ZERO(&input_fds);
    FD_ZERO(&output_fds);
    FD_ZERO(&exception_fds);
    FD_SET(listen_sock_.number(), &input_fds);
    int max_fd = listen_sock_.number();
    for (auto &[id, channel] : channels_)
        max_fd = std::max(max_fd, channel->set_fds(input_fds, output_fds, exception_fds));

    // Wakes often enough for guided route steps to be on time.
    timeval timeout = {0, 100'000};
    int num_fds = select(max_fd + 1, &input_fds, &output_fds, &exception_fds, &timeout);
    if (num_fds == -1 && errno != EINTR)
        throw fmt::system_error(errno, "Unable to select()");
    if (num_fds <= 0)
        return;

    if (FD_ISSET(listen_sock_.number(), &input_fds))
        accept_new_connection();

    for (auto &[id, channel] : channels_)
        channel->check_fds(input_fds, output_fds, exception_fds, now);
}

void Server::accept_new_connection() {
    sockaddr_in incoming{};
    socklen_t len = sizeof(incoming);
    try {
        auto new_fd = listen_sock_.accept(reinterpret_cast<sockaddr *>(&incoming), &len);

        if (channels_.size() >= max_channels_) {
            new_fd.write("Newhaven is full!\n\rTry again soon.\n\r"sv);
            log_.warn("Rejected connection - out of channels");
            return;
        }

        const auto id = next_id_++;
        channels_.emplace(id, std::make_unique<Channel>(*this, game_, id, std::move(new_fd), incoming));
    } catch (const std::runtime_error &re) {
        log_.warn("Unable to accept new connection: {}", re.what());
    }
}
