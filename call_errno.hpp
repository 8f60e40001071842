#pragma once

#include "thread_context.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

struct errno_exception : public std::exception {
    errno_exception(int err, const std::string &syscall) : caught_errno(err) {
        std::ostringstream oss;
        oss << syscall << " " << std::strerror(err);
        for (auto &[k, v] : thread_context) { oss << " " << k << "=" << v; }
        message = oss.str();
    }

    int caught_errno;
    std::string message;

    [[nodiscard]] const char *what() const noexcept override { return message.c_str(); }
};

#define CALL_ERRNO_BAD_VALUE(name, bad_value, ...) call_errno_bad_value([&] { return name(__VA_ARGS__); }, #name, bad_value)
#define CALL_ERRNO_MINUS_1(name, ...) CALL_ERRNO_BAD_VALUE(name, -1, __VA_ARGS__)
#define CALL_ERRNO_MINUS_1_RETRY_EINTR(name, ...) call_errno_retry_eintr([&] { return name(__VA_ARGS__); }, #name)
// for the pthread and posix_spawn family which return the error instead of setting errno
#define CALL_ERRNO_RETURNED(name, ...) call_errno_returned([&] { return name(__VA_ARGS__); }, #name)

template <typename Function> inline auto call_errno_bad_value(Function const &f, char const *name, decltype(f()) bad_value) -> decltype(f()) {
    auto ret = f();
    if (ret == bad_value) { throw errno_exception(errno, name); }
    return ret;
}

template <typename Function> inline auto call_errno_retry_eintr(Function const &f, char const *name) -> decltype(f()) {
    for (;;) {
        auto ret = f();
        if (ret != -1) { return ret; }
        if (errno != EINTR) { throw errno_exception(errno, name); }
    }
}

template <typename Function> inline void call_errno_returned(Function const &f, char const *name) {
    if (auto err = f()) { throw errno_exception(err, name); }
}
