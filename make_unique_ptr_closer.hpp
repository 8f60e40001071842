#pragma once

#include <unistd.h>

#include <memory>
#include <utility>

template<typename T, typename Deleter>
inline std::unique_ptr<T, Deleter> make_unique_ptr_closer(T *type, Deleter deleter) {
    return std::unique_ptr<T, Deleter>(type, deleter);
}

// owns a file descriptor; -1 means nothing is held
struct unique_fd_closer {
    int fd = -1;

    unique_fd_closer() = default;
    explicit unique_fd_closer(int f) : fd(f) {}
    unique_fd_closer(unique_fd_closer &&other) noexcept : fd(std::exchange(other.fd, -1)) {}
    unique_fd_closer &operator=(unique_fd_closer &&other) noexcept {
        if (this != &other) {
            close_fd();
            fd = std::exchange(other.fd, -1);
        }
        return *this;
    }
    unique_fd_closer(unique_fd_closer const &) = delete;
    unique_fd_closer &operator=(unique_fd_closer const &) = delete;

    ~unique_fd_closer() { close_fd(); }

    void close_fd() {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
};
