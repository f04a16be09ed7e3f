#include "Channel.hpp"

#include "Game.hpp"
#include "Server.hpp"

#include <arpa/inet.h>
#include <fmt/format.h>

#include <array>

static constexpr auto MaxIncomingDataBufferSize = 2048u;

namespace {

std::string address_of(const sockaddr_in &address) {
    char buffer[INET_ADDRSTRLEN]{};
    if (!inet_ntop(AF_INET, &address.sin_addr, buffer, sizeof(buffer)))
        return "unknown";
    return fmt::format("{}:{}", buffer, ntohs(address.sin_port));
}

}

Channel::Channel(Server &server, Game &game, SessionId id, Fd fd, const sockaddr_in &address)
    : log_(logger_for(fmt::format("Channel.{}", id))), server_(server), game_(game), id_(id), fd_(std::move(fd)),
      address_(address_of(address)), connection_(std::make_shared<ChannelConnection>()) {
    fd_.set_non_blocking();
    log_.info("Incoming connection from {} on fd {}", address_, fd_.number());
    game_.on_connect(id_, connection_);
}

void Channel::close() {
    if (is_closed())
        return;
    log_.info("Closing connection to {}", address_);
    // Best effort goodbye: anything still queued goes out if the socket will take it.
    flush_output();
    connection_->close();
    fd_.close();
    game_.on_disconnect(id_);
    server_.schedule_remove(*this);
}

int Channel::set_fds(fd_set &input_fds, fd_set &output_fds, fd_set &exception_fds) const noexcept {
    if (is_closed())
        return 0;
    const auto fd = fd_.number();
    FD_SET(fd, &input_fds);
    FD_SET(fd, &exception_fds);
    if (!unsent_.empty() || connection_->has_pending())
        FD_SET(fd, &output_fds);
    return fd;
}

void Channel::check_fds(const fd_set &input_fds, const fd_set &output_fds, const fd_set &exception_fds, Time now) {
    if (is_closed())
        return;
    const auto fd = fd_.number();
    if (FD_ISSET(fd, &exception_fds)) {
        log_.info("Exception raised on socket");
        close();
        return;
    }
    if (FD_ISSET(fd, &input_fds))
        on_data_available(now);
    if (!is_closed() && FD_ISSET(fd, &output_fds))
        flush_output();
}

void Channel::flush() {
    if (is_closed())
        return;
    if (!connection_->is_open()) {
        log_.warn("Client fell too far behind; dropping it");
        close();
        return;
    }
    flush_output();
}

void Channel::on_data_available(Time now) {
    std::array<byte, MaxIncomingDataBufferSize> buffer;
    size_t num_read = 0;
    try {
        num_read = fd_.try_read_some(buffer);
    } catch (const std::runtime_error &re) {
        log_.info("Error reading from socket: {}", re.what());
        close();
        return;
    }
    if (num_read == 0) {
        log_.info("Connection closed by peer");
        close();
        return;
    }
    if (num_read + lines_.buffered_size() >= MaxIncomingDataBufferSize) {
        log_.warn("Client sent too much data ({}>{})", num_read + lines_.buffered_size(), MaxIncomingDataBufferSize);
        if (!connection_->send(Event{EventKind::Error, ">>> Too much incoming data at once; slow down."}))
            log_.debug("Couldn't warn the client");
        close();
        return;
    }

    for (const auto &line : lines_.add_data(gsl::span<const byte>(buffer.data(), num_read))) {
        if (!game_.on_line(id_, line, now)) {
            close();
            return;
        }
    }
}

void Channel::flush_output() {
    unsent_ += connection_->take_pending();
    if (unsent_.empty() || is_closed())
        return;
    if (unsent_.size() > ChannelConnection::MaxPendingOutput * 2) {
        unsent_.clear();
        connection_->close();
        return;
    }
    try {
        const auto written = fd_.try_write_some(unsent_);
        unsent_.erase(0, written);
    } catch (const std::runtime_error &re) {
        log_.info("Error writing to socket: {}", re.what());
        unsent_.clear();
        connection_->close();
    }
}
