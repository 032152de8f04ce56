#include "sandbox/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace voxgate::sandbox {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n,
                    size_t limit, bool& truncated) {
    if (n <= 0) return;
    const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const size_t take = std::min<size_t>(static_cast<size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<size_t>(n)) {
        truncated = true;
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Reads what is available; closes the fd on EOF or error.
void drain(int& fd, std::string& dst, size_t limit, bool& truncated) {
    char buf[4096];
    while (fd >= 0) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_limited(dst, buf, n, limit, truncated);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
    }
}

// Child side of fork: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const ProcessSpec& spec, char* const* argv,
                             int out_fd, int err_fd, int status_fd) {
    auto report = [status_fd](int err) {
        ssize_t ignored = write(status_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    };

    setsid();

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0) report(errno);
    if (dup2(devnull, STDIN_FILENO) < 0) report(errno);
    if (dup2(out_fd, STDOUT_FILENO) < 0) report(errno);
    if (dup2(err_fd, STDERR_FILENO) < 0) report(errno);
    close(devnull);
    close(out_fd);
    close(err_fd);

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
        report(errno);
    }

    if (spec.max_memory_bytes > 0) {
        struct rlimit rl;
        rl.rlim_cur = spec.max_memory_bytes;
        rl.rlim_max = spec.max_memory_bytes;
        if (setrlimit(RLIMIT_AS, &rl) != 0) report(errno);
    }

    execvp(argv[0], argv);
    report(errno);
    _exit(127);
}

} // namespace

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult result;
    if (spec.argv.empty()) {
        result.spawn_failed = true;
        result.error_message = "empty argv";
        result.exit_code = 127;
        return result;
    }

    // Built before fork; the child must not allocate.
    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], status_pipe[0], status_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
        result.spawn_failed = true;
        result.exit_code = 127;
        result.error_message = std::string("pipe failed: ") + std::strerror(err);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], status_pipe[0], status_pipe[1]}) {
            close(fd);
        }
        result.spawn_failed = true;
        result.exit_code = 127;
        result.error_message = std::string("fork failed: ") + std::strerror(err);
        return result;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        close(status_pipe[0]);
        exec_child(spec, argv.data(), out_pipe[1], err_pipe[1], status_pipe[1]);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    // The status pipe closes on successful exec (O_CLOEXEC) or carries errno.
    int exec_errno = 0;
    ssize_t status_read;
    do {
        status_read = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_read < 0 && errno == EINTR);
    close(status_pipe[0]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    int status = 0;

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_fd);
        close_fd(err_fd);
        result.spawn_failed = true;
        result.exit_code = 127;
        result.error_message = std::string("spawn failed: ") + std::strerror(exec_errno);
        return result;
    }

    if (fcntl(out_fd, F_SETFL, O_NONBLOCK) != 0 || fcntl(err_fd, F_SETFL, O_NONBLOCK) != 0) {
        int err = errno;
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_fd);
        close_fd(err_fd);
        result.exit_code = 127;
        result.error_message = std::string("fcntl failed: ") + std::strerror(err);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    bool exited = false;
    while (!exited) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            result.timed_out = true;
            break;
        }

        const int wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 20));
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};
        int rc = nfds > 0 ? poll(fds, nfds, wait_ms) : poll(nullptr, 0, wait_ms);
        if (rc < 0 && errno != EINTR) {
            result.error_message = std::string("poll failed: ") + std::strerror(errno);
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            break;
        }

        drain(out_fd, result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
        drain(err_fd, result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
        } else if (w < 0 && errno != EINTR) {
            result.error_message = std::string("waitpid failed: ") + std::strerror(errno);
            exited = true;
        }
    }

    if (result.timed_out) {
        // Partial output of a killed child is discarded.
        close_fd(out_fd);
        close_fd(err_fd);
        result.stdout_text.clear();
        result.stderr_text.clear();
        result.exit_code = 124;
        return result;
    }

    drain(out_fd, result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
    drain(err_fd, result.stderr_text, spec.max_output_bytes, result.stderr_truncated);
    close_fd(out_fd);
    close_fd(err_fd);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace voxgate::sandbox
