#include "Fd.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <fcntl.h>

void Fd::write(std::string_view text) const {
    if (!is_open())
        throw std::runtime_error("Write called on invalid file descriptor");
    auto num = ::write(fd_, text.data(), text.size());
    if (num < 0)
        throw fmt::system_error(errno, "Unable to write to {}", fd_);
    if (static_cast<size_t>(num) != text.size())
        throw std::runtime_error(fmt::format("Truncated write to file descriptor {} ({}/{})", fd_, num, text.size()));
}

size_t Fd::try_write_some(gsl::span<const char> span) const {
    if (!is_open())
        throw std::runtime_error("Write called on invalid file descriptor");
    auto num = ::send(fd_, span.data(), span.size_bytes(), MSG_NOSIGNAL);
    if (num < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;
        throw fmt::system_error(errno, "Unable to write to {}", fd_);
    }
    return static_cast<size_t>(num);
}

size_t Fd::try_read_some(gsl::span<byte> span) const {
    if (!is_open())
        throw std::runtime_error("Read called on invalid file descriptor");
    auto num_bytes = ::read(fd_, span.data(), span.size_bytes());
    if (num_bytes < 0)
        throw fmt::system_error(errno, "Unable to read from {}", fd_);
    return static_cast<size_t>(num_bytes);
}

const Fd &Fd::set_non_blocking() const {
    const auto flags = ::fcntl(number(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0)
        throw fmt::system_error(errno, "Unable to make file descriptor {} non-blocking", fd_);
    return *this;
}

Fd Fd::accept(sockaddr *address, socklen_t *socklen) const {
    auto accepted_fd = ::accept(fd_, address, socklen);
    if (accepted_fd < 0)
        throw fmt::system_error(errno, "Unable to accept from file descriptor {}", fd_);
    return Fd(accepted_fd);
}

Fd Fd::socket(int domain, int type, int protocol) {
    int socket_fd = ::socket(domain, type, protocol);
    if (socket_fd < 0)
        throw fmt::system_error(
            errno, "Unable to create a socket (domain {}, type {}, protocol {})", domain, type, protocol);
    return Fd(socket_fd);
}

const Fd &Fd::setsockopt(int level, int optname, const void *optval, socklen_t optlen) const {
    if (!is_open())
        throw std::runtime_error("setsockopt called on invalid file descriptor");

    if (::setsockopt(fd_, level, optname, optval, optlen) < 0)
        throw fmt::system_error(errno, "Unable to set socket option {}:{}", level, optname);
    return *this;
}

const Fd &Fd::bind(const sockaddr *address, socklen_t socklen) const {
    if (::bind(fd_, address, socklen) < 0)
        throw fmt::system_error(errno, "Unable to bind to address");
    return *this;
}

const Fd &Fd::listen(int backlog) const {
    if (::listen(fd_, backlog) < 0)
        throw fmt::system_error(errno, "Unable to listen");
    return *this;
}
