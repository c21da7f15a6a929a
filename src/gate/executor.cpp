/*
 * bashgate C++17 - Command Executor Implementation
 *
 * fork/execve with three close-on-exec pipes: stdout, stderr and a status
 * pipe the child uses to report a failed chdir()/execve(). A successful
 * execve closes the status pipe, so EOF on it means "running".
 */
#include <bashgate/gate/executor.hpp>
#include <bashgate/core/logger.hpp>
#include <bashgate/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bashgate {

namespace {

const char* const DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";
const int POLL_SLICE_MS = 50;
const size_t READ_CHUNK = 4096;

enum SpawnStage {
    STAGE_SETUP = 1,
    STAGE_CHDIR = 2,
    STAGE_EXEC = 3
};

struct SpawnReport {
    int stage;
    int err;
};

// Runs in the forked child: async-signal-safe calls only
[[noreturn]] void report_and_exit(int fd, int stage) {
    SpawnReport report;
    report.stage = stage;
    report.err = errno;
    const char* p = reinterpret_cast<const char*>(&report);
    size_t left = sizeof(report);
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    _exit(127);
}

struct OutputCapture {
    size_t limit;
    std::string combined;
    std::string stderr_text;
    bool truncated;

    explicit OutputCapture(size_t max_bytes) : limit(max_bytes), truncated(false) {}

    void append(const char* data, size_t n, bool from_stderr) {
        size_t room = combined.size() < limit ? limit - combined.size() : 0;
        size_t take = std::min(n, room);
        combined.append(data, take);
        if (take < n) {
            truncated = true;
        }
        if (from_stderr) {
            size_t err_room = stderr_text.size() < limit ? limit - stderr_text.size() : 0;
            stderr_text.append(data, std::min(n, err_room));
        }
    }
};

enum ReadOutcome {
    READ_AGAIN,     // Nothing more right now
    READ_EOF,       // Writer side closed
    READ_ERROR      // errno describes it
};

// Read everything currently available from a non-blocking fd
ReadOutcome drain_fd(int fd, OutputCapture& capture, bool from_stderr) {
    char buffer[READ_CHUNK];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            capture.append(buffer, static_cast<size_t>(n), from_stderr);
            continue;
        }
        if (n == 0) {
            return READ_EOF;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return READ_AGAIN;
        }
        return READ_ERROR;
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string spawn_failure_message(const SpawnReport& report, const std::string& shell,
                                  const std::string& workdir) {
    std::string what;
    switch (report.stage) {
        case STAGE_CHDIR:
            what = "cannot change to directory '" + workdir + "'";
            break;
        case STAGE_EXEC:
            what = "cannot execute shell '" + shell + "'";
            break;
        default:
            what = "cannot set up child process";
            break;
    }
    return "Failed to start command: " + what + ": " + strerror(report.err);
}

} // namespace

// ============================================================================
// ScopedFd
// ============================================================================

void ScopedFd::reset(int fd) {
    if (fd_ >= 0) {
        close(fd_);
    }
    fd_ = fd;
}

int ScopedFd::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

// ============================================================================
// ChildProcess
// ============================================================================

ChildProcess::ChildProcess(pid_t pid)
    : pid_(pid)
    , reaped_(false)
    , status_(0)
{}

ChildProcess::~ChildProcess() {
    if (!reaped_) {
        LOG_DEBUG("Cleaning up process group %d", static_cast<int>(pid_));
        signal_group(SIGKILL);
        reap();
    }
}

bool ChildProcess::has_exited() {
    if (reaped_) return true;

    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        // ECHILD: nothing left to wait for
        return errno == ECHILD;
    }
    return info.si_pid == pid_;
}

int ChildProcess::finish() {
    if (!reaped_) {
        // The leader is a zombie until reaped, so the group id cannot have
        // been recycled; anything still in it was started by the command
        signal_group(SIGKILL);
        reap();
    }
    return status_;
}

int ChildProcess::terminate(int grace_ms) {
    if (reaped_) return status_;

    signal_group(SIGTERM);
    int64_t until = monotonic_ms() + std::max(grace_ms, 0);
    while (!has_exited() && monotonic_ms() < until) {
        usleep(10000);
    }
    signal_group(SIGKILL);
    reap();
    return status_;
}

void ChildProcess::signal_group(int sig) {
    if (kill(-pid_, sig) != 0 && errno == ESRCH) {
        // No group (setpgid lost a race with an early exit); the leader
        // itself is still unreaped, so signalling it by pid is safe
        kill(pid_, sig);
    }
}

int ChildProcess::reap() {
    while (waitpid(pid_, &status_, 0) < 0) {
        if (errno == EINTR) continue;
        LOG_ERROR("waitpid(%d) failed: %s", static_cast<int>(pid_), strerror(errno));
        status_ = -1;
        break;
    }
    reaped_ = true;
    return status_;
}

// ============================================================================
// Executor
// ============================================================================

Executor::Executor(const ExecutorOptions& options) : options_(options) {
    if (options_.shell.empty()) {
        options_.shell = "/bin/sh";
    }
}

std::vector<std::string> Executor::build_environment(const std::string& workdir) {
    std::vector<std::string> env;

    const char* path = getenv("PATH");
    env.push_back(std::string("PATH=") + ((path && path[0] != '\0') ? path : DEFAULT_PATH));

    static const char* const carried[] = { "HOME", "USER", "LANG", NULL };
    for (int i = 0; carried[i] != NULL; ++i) {
        const char* value = getenv(carried[i]);
        if (value) {
            env.push_back(std::string(carried[i]) + "=" + value);
        }
    }

    env.push_back("PWD=" + workdir);

    // Keep the child away from the terminal and from interactive prompts
    env.push_back("TERM=dumb");
    env.push_back("NO_COLOR=1");
    env.push_back("PAGER=cat");
    env.push_back("GIT_PAGER=cat");
    env.push_back("GIT_TERMINAL_PROMPT=0");
    env.push_back("DEBIAN_FRONTEND=noninteractive");

    return env;
}

ExecutionResult Executor::run(const ExecutionRequest& request, const std::string& workdir,
                              size_t max_output_size) const {
    const std::string& command = request.command;

    // Everything the child touches is prepared before fork()
    std::vector<std::string> env_strings = build_environment(workdir);
    std::vector<char*> envp;
    for (size_t i = 0; i < env_strings.size(); ++i) {
        envp.push_back(const_cast<char*>(env_strings[i].c_str()));
    }
    envp.push_back(NULL);

    const std::string& shell = options_.shell;
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(shell.c_str()));
    argv.push_back(const_cast<char*>("-c"));
    argv.push_back(const_cast<char*>(command.c_str()));
    argv.push_back(NULL);

    int out_pipe[2], err_pipe[2], status_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        return ExecutionResult::faulted(command, ErrorKind::SPAWN_FAILURE,
                                        std::string("Failed to create pipe: ") + strerror(errno));
    }
    ScopedFd out_read(out_pipe[0]), out_write(out_pipe[1]);

    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        return ExecutionResult::faulted(command, ErrorKind::SPAWN_FAILURE,
                                        std::string("Failed to create pipe: ") + strerror(errno));
    }
    ScopedFd err_read(err_pipe[0]), err_write(err_pipe[1]);

    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        return ExecutionResult::faulted(command, ErrorKind::SPAWN_FAILURE,
                                        std::string("Failed to create pipe: ") + strerror(errno));
    }
    ScopedFd status_read(status_pipe[0]), status_write(status_pipe[1]);

    pid_t pid = fork();
    if (pid < 0) {
        return ExecutionResult::faulted(command, ErrorKind::SPAWN_FAILURE,
                                        std::string("Failed to fork: ") + strerror(errno));
    }

    if (pid == 0) {
        // Child
        setpgid(0, 0);

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, NULL);

        struct sigaction dfl;
        memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &dfl, NULL);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 ||
            dup2(devnull, STDIN_FILENO) < 0 ||
            dup2(out_write.get(), STDOUT_FILENO) < 0 ||
            dup2(err_write.get(), STDERR_FILENO) < 0) {
            report_and_exit(status_write.get(), STAGE_SETUP);
        }

        if (chdir(workdir.c_str()) != 0) {
            report_and_exit(status_write.get(), STAGE_CHDIR);
        }

        execve(argv[0], argv.data(), envp.data());
        report_and_exit(status_write.get(), STAGE_EXEC);
    }

    // Parent. From here on `child` owns the process.
    ChildProcess child(pid);
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        LOG_DEBUG("setpgid(%d) from parent: %s", static_cast<int>(pid), strerror(errno));
    }
    out_write.reset();
    err_write.reset();
    status_write.reset();

    SpawnReport report;
    memset(&report, 0, sizeof(report));
    size_t got = 0;
    while (got < sizeof(report)) {
        ssize_t n = read(status_read.get(), reinterpret_cast<char*>(&report) + got, sizeof(report) - got);
        if (n > 0) {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    status_read.reset();

    if (got == sizeof(report)) {
        child.finish();
        std::string message = spawn_failure_message(report, shell, workdir);
        LOG_WARN("%s", message.c_str());
        return ExecutionResult::faulted(command, ErrorKind::SPAWN_FAILURE, message);
    }

    LOG_DEBUG("Spawned pid %d in %s: %s", static_cast<int>(pid), workdir.c_str(), command.c_str());

    if (!set_nonblocking(out_read.get()) || !set_nonblocking(err_read.get())) {
        int err = errno;
        LOG_ERROR("Cannot make output pipes non-blocking: %s", strerror(err));
        child.terminate(0);
        return ExecutionResult::faulted(command, ErrorKind::INTERNAL_FAULT,
                                        std::string("Internal error preparing output pipes: ") + strerror(err));
    }

    OutputCapture capture(max_output_size);
    const bool has_deadline = request.has_timeout();
    const int64_t deadline = monotonic_ms() + request.timeout_ms();
    bool exited = false;
    int64_t exited_at = 0;
    bool timed_out = false;

    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_read.valid()) {
            fds[nfds].fd = out_read.get();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (err_read.valid()) {
            fds[nfds].fd = err_read.get();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }

        int64_t now = monotonic_ms();
        int64_t wait_ms = POLL_SLICE_MS;
        if (has_deadline && !exited) {
            wait_ms = std::min<int64_t>(wait_ms, std::max<int64_t>(deadline - now, 0));
        }
        if (exited) {
            wait_ms = std::min<int64_t>(wait_ms, std::max<int64_t>(exited_at + options_.drain_ms - now, 0));
        }

        if (poll(nfds > 0 ? fds : NULL, nfds, static_cast<int>(wait_ms)) < 0 && errno != EINTR) {
            int err = errno;
            LOG_ERROR("poll() on output pipes of pid %d failed: %s", static_cast<int>(pid), strerror(err));
            child.terminate(0);
            return ExecutionResult::faulted(command, ErrorKind::INTERNAL_FAULT,
                                            std::string("Internal error while waiting for command output: ") + strerror(err),
                                            capture.combined, capture.truncated);
        }

        ScopedFd* streams[2] = { &out_read, &err_read };
        for (int i = 0; i < 2; ++i) {
            if (!streams[i]->valid()) continue;
            ReadOutcome outcome = drain_fd(streams[i]->get(), capture, i == 1);
            if (outcome == READ_EOF) {
                streams[i]->reset();
            } else if (outcome == READ_ERROR) {
                int err = errno;
                LOG_ERROR("Reading output of pid %d failed: %s", static_cast<int>(pid), strerror(err));
                child.terminate(0);
                return ExecutionResult::faulted(command, ErrorKind::INTERNAL_FAULT,
                                                std::string("Internal error while reading command output: ") + strerror(err),
                                                capture.combined, capture.truncated);
            }
        }

        if (!exited && child.has_exited()) {
            exited = true;
            exited_at = monotonic_ms();
        }
        if (exited && !out_read.valid() && !err_read.valid()) {
            break;
        }
        if (exited && monotonic_ms() >= exited_at + options_.drain_ms) {
            // Something the command backgrounded still holds the pipes
            break;
        }
        if (!exited && has_deadline && monotonic_ms() >= deadline) {
            timed_out = true;
            break;
        }
    }

    if (timed_out) {
        LOG_WARN("Command timed out after %gs, terminating process group %d: %s",
                 request.timeout_seconds, static_cast<int>(pid), command.c_str());
        child.terminate(options_.kill_grace_ms);
        if (out_read.valid()) drain_fd(out_read.get(), capture, false);
        if (err_read.valid()) drain_fd(err_read.get(), capture, true);
        return ExecutionResult::timed_out(command, request.timeout_seconds,
                                          capture.combined, capture.truncated);
    }

    int status = child.finish();
    if (out_read.valid()) drain_fd(out_read.get(), capture, false);
    if (err_read.valid()) drain_fd(err_read.get(), capture, true);

    if (status != -1 && WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        LOG_DEBUG("pid %d exited with %d (%zu bytes output%s)", static_cast<int>(pid), code,
                  capture.combined.size(), capture.truncated ? ", truncated" : "");
        return ExecutionResult::completed(command, code, capture.combined,
                                          capture.stderr_text, capture.truncated);
    }
    if (status != -1 && WIFSIGNALED(status)) {
        return ExecutionResult::signaled(command, WTERMSIG(status), capture.combined, capture.truncated);
    }

    return ExecutionResult::faulted(command, ErrorKind::INTERNAL_FAULT,
                                    "Internal error: lost track of the command's exit status",
                                    capture.combined, capture.truncated);
}

} // namespace bashgate
