#include "command_output.hpp"

#include "call_errno.hpp"
#include "make_unique_ptr_closer.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cmath>
#include <stdexcept>

extern char **environ;

namespace {
struct child_reaper {
    pid_t child_pid;
    bool child_reaped = false;

    explicit child_reaper(pid_t pid) : child_pid(pid) {}
    child_reaper(child_reaper const &) = delete;
    child_reaper &operator=(child_reaper const &) = delete;

    int reap() {
        int status = 0;
        CALL_ERRNO_MINUS_1_RETRY_EINTR(waitpid, child_pid, &status, 0);
        child_reaped = true;
        return status;
    }

    ~child_reaper() {
        if (!child_reaped) {
            ::kill(child_pid, SIGKILL);
            while (::waitpid(child_pid, nullptr, 0) == -1 && errno == EINTR) {}
        }
    }
};
} // namespace

std::optional<std::string> command_output_with_deadline(std::vector<std::string> const &argv, double budget_seconds) {
    if (argv.empty()) { throw std::invalid_argument("command_output_with_deadline empty argv"); }
    add_thread_context _("command", argv.front());

    int pipe_fds[2];
    CALL_ERRNO_MINUS_1(pipe2, pipe_fds, O_CLOEXEC);
    unique_fd_closer read_end{pipe_fds[0]};
    unique_fd_closer write_end{pipe_fds[1]};

    posix_spawn_file_actions_t actions;
    CALL_ERRNO_RETURNED(posix_spawn_file_actions_init, &actions);
    auto actions_holder = make_unique_ptr_closer(&actions, [](posix_spawn_file_actions_t *a) { posix_spawn_file_actions_destroy(a); });
    CALL_ERRNO_RETURNED(posix_spawn_file_actions_addopen, &actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    CALL_ERRNO_RETURNED(posix_spawn_file_actions_adddup2, &actions, write_end.fd, STDOUT_FILENO);
    CALL_ERRNO_RETURNED(posix_spawn_file_actions_addopen, &actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<char *> args;
    for (auto &&a : argv) { args.push_back(const_cast<char *>(a.c_str())); }
    args.push_back(nullptr);

    pid_t pid;
    CALL_ERRNO_RETURNED(posix_spawnp, &pid, args[0], &actions, nullptr, args.data(), environ);
    child_reaper reaper{pid};
    write_end.close_fd();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(budget_seconds));
    std::string output;
    char buffer[4096];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) { return std::nullopt; }
        pollfd pfd{read_end.fd, POLLIN, 0};
        if (!CALL_ERRNO_MINUS_1_RETRY_EINTR(poll, &pfd, 1, static_cast<int>(remaining))) { continue; }
        auto got = CALL_ERRNO_MINUS_1_RETRY_EINTR(read, read_end.fd, buffer, sizeof(buffer));
        if (got == 0) { break; }
        output.append(buffer, got);
    }
    reaper.reap();
    return output;
}
