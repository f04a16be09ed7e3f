#pragma once

#include <gsl/span>

#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <sys/socket.h>
#include <unistd.h>

using byte = unsigned char;

// Owns a file descriptor, closing it on destruction. Socket setup calls chain, and all failures throw
// fmt::system_error carrying errno.
class Fd {
    int fd_;

public:
    Fd() : fd_(-1) {}
    explicit Fd(int fd) noexcept : fd_(fd) {}
    ~Fd() noexcept { close(); }
    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;
    Fd(Fd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd &operator=(Fd &&other) noexcept {
        close();
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int number() const {
        if (!is_open())
            throw std::runtime_error("Attempt to get handle for invalid file descriptor");
        return fd_;
    }
    void close() noexcept {
        if (is_open())
            ::close(fd_);
        fd_ = -1;
    }

    // Writes everything or throws. Only used for short messages on freshly accepted sockets.
    void write(std::string_view text) const;
    // Writes as much as the socket accepts without blocking, returning the number of bytes taken.
    [[nodiscard]] size_t try_write_some(gsl::span<const char> span) const;
    // Reads whatever is available; zero means the peer closed.
    [[nodiscard]] size_t try_read_some(gsl::span<byte> span) const;

    const Fd &set_non_blocking() const;

    template <typename T>
    const Fd &setsockopt(int level, int optname, const T &optval) const {
        return setsockopt(level, optname, &optval, sizeof(optval));
    }
    const Fd &setsockopt(int level, int optname, const void *optval, socklen_t optlen) const;

    template <typename T>
    const Fd &bind(const T &address) const {
        static_assert(sizeof(T) >= sizeof(sockaddr));
        return bind(reinterpret_cast<const sockaddr *>(&address), sizeof(T));
    }
    const Fd &bind(const sockaddr *address, socklen_t socklen) const;
    const Fd &listen(int backlog) const;

    Fd accept(sockaddr *address, socklen_t *socklen) const;
    static Fd socket(int domain, int type, int protocol);
};
