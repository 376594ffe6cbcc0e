#include "kit/process.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace kit {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto KILL_GRACE = std::chrono::seconds(2);
constexpr int POLL_SLICE_MS = 50;

// Closes a descriptor on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

bool make_pipe(FdGuard& read_end, FdGuard& write_end) {
    int fds[2];
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Wait for pid until the deadline; returns the raw status if reaped
std::optional<int> wait_until(pid_t pid, std::optional<Clock::time_point> deadline) {
    while (true) {
        int status = 0;
        pid_t rc = waitpid(pid, &status, deadline ? WNOHANG : 0);
        if (rc == pid) return status;
        if (rc < 0) {
            if (errno == EINTR) continue;
            return std::nullopt;
        }
        if (deadline && Clock::now() >= *deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

int terminate_child(pid_t pid) {
    kill(pid, SIGTERM);
    if (auto status = wait_until(pid, Clock::now() + KILL_GRACE)) {
        return decode_status(*status);
    }
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decode_status(status);
}

void append_capped(ProcessResult& result, const char* data, size_t size, size_t limit) {
    result.output.append(data, size);
    if (limit > 0 && result.output.size() > limit) {
        result.output.erase(0, result.output.size() - limit);
        result.truncated = true;
    }
}

// Read whatever is already buffered in the pipe without waiting for EOF.
// Bounded so a grandchild that keeps writing cannot hold us here.
void drain_ready(int fd, ProcessResult& result, size_t limit) {
    char buffer[8192];
    size_t budget = limit > 0 ? limit : (size_t{1} << 20);
    size_t drained = 0;
    while (drained < budget) {
        struct pollfd pfd {
            fd, POLLIN, 0
        };
        int rc = poll(&pfd, 1, 0);
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) return;
        ssize_t got = read(fd, buffer, sizeof(buffer));
        if (got < 0 && errno == EINTR) continue;
        if (got <= 0) return;
        drained += static_cast<size_t>(got);
        append_capped(result, buffer, static_cast<size_t>(got), limit);
    }
}

int remaining_millis(std::optional<Clock::time_point> deadline) {
    if (!deadline) return -1;
    auto now = Clock::now();
    if (now >= *deadline) return 0;
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now).count());
}

} // namespace

ProcessResult run_process(const ProcessOptions& options) {
    ProcessResult result;

    if (options.argv.empty() || options.argv[0].empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> argv;
    for (const auto& s : options.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    FdGuard out_read, out_write;
    FdGuard exec_read, exec_write;
    if (!make_pipe(out_read, out_write) || !make_pipe(exec_read, exec_write)) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    std::optional<Clock::time_point> deadline;
    if (options.timeout_ms > 0) {
        deadline = Clock::now() + std::chrono::milliseconds(options.timeout_ms);
    }

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child: stdout+stderr into the capture pipe, stdin from /dev/null
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_write.get(), STDOUT_FILENO);
        dup2(out_write.get(), STDERR_FILENO);

        execvp(argv[0], argv.data());

        // exec_write is close-on-exec, so reaching here means exec failed
        int err = errno;
        ssize_t ignored = write(exec_write.get(), &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    out_write.reset();
    exec_write.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_read.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        result.error = "cannot execute " + options.argv[0] + ": " + strerror(exec_errno);
        return result;
    }

    result.spawned = true;
    spdlog::debug("spawned pid {}: {}", pid, options.argv[0]);

    // Reap the direct child while reading: a background grandchild may keep
    // the pipe open long after the installer itself has exited.
    char buffer[8192];
    bool eof = false;
    std::optional<int> status;
    while (true) {
        if (!status) {
            int raw = 0;
            pid_t rc = waitpid(pid, &raw, WNOHANG);
            if (rc == pid) {
                status = raw;
            } else if (rc < 0 && errno != EINTR) {
                result.error = "waitpid failed: " + std::string(strerror(errno));
                return result;
            }
        }
        if (status) {
            if (!eof) drain_ready(out_read.get(), result, options.output_limit);
            result.exit_code = decode_status(*status);
            return result;
        }

        int timeout = remaining_millis(deadline);
        if (deadline && timeout == 0) {
            result.timed_out = true;
            break;
        }
        int slice = POLL_SLICE_MS;
        if (timeout > 0 && timeout < slice) slice = timeout;

        if (eof) {
            std::this_thread::sleep_for(std::chrono::milliseconds(slice));
            continue;
        }

        struct pollfd pfd {
            out_read.get(), POLLIN, 0
        };
        int rc = poll(&pfd, 1, slice);
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (rc == 0) continue;

        ssize_t got = read(out_read.get(), buffer, sizeof(buffer));
        if (got > 0) {
            append_capped(result, buffer, static_cast<size_t>(got), options.output_limit);
        } else if (got == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            result.error = "read failed: " + std::string(strerror(errno));
            break;
        }
    }

    if (!result.timed_out) {
        // poll/read failed; still reap the child
        if (auto reaped = wait_until(pid, deadline)) {
            result.exit_code = decode_status(*reaped);
            return result;
        }
        result.timed_out = true;
    }

    spdlog::warn("pid {} exceeded {} ms, terminating", pid, options.timeout_ms);
    result.exit_code = terminate_child(pid);
    return result;
}

} // namespace kit
