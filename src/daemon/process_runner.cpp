#include "daemon/process_runner.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <chrono>
#include <cerrno>
#include <thread>

using Clock = std::chrono::steady_clock;

static std::vector<const char*> make_argv(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    return argv;
}

/// Point fd at /dev/null (child side only)
static void redirect_to_null(int fd, int flags) {
    int null_fd = open("/dev/null", flags);
    if (null_fd < 0) return;
    if (null_fd != fd) {
        dup2(null_fd, fd);
        close(null_fd);
    }
}

static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

static void kill_and_reap(pid_t pid) {
    kill(pid, SIGKILL);
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

std::string ProcessRunner::chomp(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

CommandResult ProcessRunner::run(const std::vector<std::string>& args, int timeout_ms) {
    CommandResult result;
    if (args.empty()) return result;

    // Build argv before forking; the child must not allocate
    auto argv = make_argv(args);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) return result;

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(fds[1], STDOUT_FILENO);
        redirect_to_null(STDIN_FILENO, O_RDONLY);
        redirect_to_null(STDERR_FILENO, O_WRONLY);

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    // Parent process
    result.spawned = true;
    close(fds[1]);

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        struct pollfd pfd;
        pfd.fd = fds[0];
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, remaining_ms(deadline));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            result.timed_out = true;
            break;
        }

        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            // Keep draining past the cap so the child never blocks on a full pipe
            size_t room = MAX_OUTPUT - result.output.size();
            size_t take = static_cast<size_t>(n) < room ? static_cast<size_t>(n) : room;
            result.output.append(buffer, take);
            if (take < static_cast<size_t>(n)) result.truncated = true;
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(fds[0]);

    if (result.timed_out) {
        kill_and_reap(pid);
        return result;
    }

    // Output is done; give the child the rest of the budget to exit
    while (true) {
        int status;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            break;
        }
        if (r < 0 && errno != EINTR) break;
        if (remaining_ms(deadline) == 0) {
            result.timed_out = true;
            kill_and_reap(pid);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    return result;
}

bool ProcessRunner::spawn_detached(const std::vector<std::string>& args) {
    if (args.empty()) return false;

    auto argv = make_argv(args);

    pid_t pid = fork();
    if (pid < 0) {
        return false; // fork failed
    }

    if (pid == 0) {
        // Intermediate child: new session, then fork the real task so that it
        // is reparented to init and the caller never has to reap it
        setsid();
        pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? 1 : 0);
        }

        redirect_to_null(STDIN_FILENO, O_RDONLY);
        redirect_to_null(STDOUT_FILENO, O_WRONLY);
        redirect_to_null(STDERR_FILENO, O_WRONLY);

        // Do not hold the caller's pipes open past its exit
        long max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd < 0 || max_fd > 4096) max_fd = 4096;
        for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
            close(fd);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    int status;
    pid_t r;
    while ((r = waitpid(pid, &status, 0)) < 0 && errno == EINTR) {}
    return r == pid && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}
