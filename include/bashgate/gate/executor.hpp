/*
 * bashgate C++17 - Command Executor
 *
 * Runs one approved command line as `<shell> -c <command>`:
 *
 *   - in the validated working directory, in a process group of its own,
 *     so a timeout takes down everything the command started;
 *   - with stdin on /dev/null and a small non-interactive environment
 *     (TERM=dumb, no pagers, no prompts) so nothing writes terminal control
 *     sequences or waits for input;
 *   - with stdout and stderr read concurrently into one buffer capped at
 *     the policy's maxOutputSize. Bytes past the cap are read and dropped,
 *     never left in the pipe, so the child cannot stall on a full pipe.
 *
 * Exactly one ChildProcess owns the pid. Every way out of run() (normal
 * exit, timeout, spawn failure, I/O fault, exception) passes through its
 * cleanup, which kills what is left of the group and reaps the leader.
 */
#ifndef bashgate_GATE_EXECUTOR_HPP
#define bashgate_GATE_EXECUTOR_HPP

#include "execution.hpp"
#include <string>
#include <vector>
#include <cstddef>
#include <sys/types.h>

namespace bashgate {

struct ExecutorOptions {
    std::string shell;          // Interpreter for the command line (default /bin/sh)
    int kill_grace_ms;          // SIGTERM -> SIGKILL delay on timeout (default 1000)
    int drain_ms;               // How long to keep reading after the leader exits (default 200)

    ExecutorOptions() : shell("/bin/sh"), kill_grace_ms(1000), drain_ms(200) {}
};

// ============================================================================
// RAII handles
// ============================================================================

class ScopedFd {
public:
    ScopedFd() : fd_(-1) {}
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1);
    int release();

private:
    ScopedFd(const ScopedFd&);
    ScopedFd& operator=(const ScopedFd&);

    int fd_;
};

// Owns a spawned child that leads its own process group
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid);
    ~ChildProcess();

    pid_t pid() const { return pid_; }

    // Non-blocking: has the leader exited? Does not reap it, so the group
    // id stays reserved until finish()/terminate().
    bool has_exited();

    // Leader has exited: kill any stragglers in the group, reap, and return
    // the wait status
    int finish();

    // SIGTERM the group, wait up to grace_ms for the leader, SIGKILL the
    // group, reap. Returns the wait status.
    int terminate(int grace_ms);

private:
    ChildProcess(const ChildProcess&);
    ChildProcess& operator=(const ChildProcess&);

    void signal_group(int sig);
    int reap();

    pid_t pid_;
    bool reaped_;
    int status_;
};

// ============================================================================
// Executor
// ============================================================================

class Executor {
public:
    explicit Executor(const ExecutorOptions& options = ExecutorOptions());

    // `workdir` must already be validated and normalized. Never throws for
    // process-level failures; they come back as Faulted results.
    ExecutionResult run(const ExecutionRequest& request, const std::string& workdir,
                        size_t max_output_size) const;

    // Environment handed to the child
    static std::vector<std::string> build_environment(const std::string& workdir);

private:
    ExecutorOptions options_;
};

} // namespace bashgate

#endif // bashgate_GATE_EXECUTOR_HPP
