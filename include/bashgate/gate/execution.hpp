/*
 * bashgate C++17 - Execution Request / Result
 *
 * One ExecutionRequest in, one ExecutionResult out. Results are plain
 * values built through the factory functions below, one per terminal
 * state of a request:
 *
 *   Pending -> Validating -> Rejected
 *                         -> Running -> Completed | TimedOut | Faulted
 */
#ifndef bashgate_GATE_EXECUTION_HPP
#define bashgate_GATE_EXECUTION_HPP

#include <bashgate/core/json.hpp>
#include <cstdint>
#include <string>

namespace bashgate {

enum class ErrorKind {
    NONE = 0,
    CONFIG_ERROR,
    COMMAND_NOT_ALLOWED,
    DIRECTORY_NOT_ALLOWED,
    INJECTION_PATTERN_DETECTED,
    SPAWN_FAILURE,
    TIMEOUT_EXCEEDED,
    INTERNAL_FAULT
};

// A command killed by a signal it did not get from us still ran to its end:
// it is Completed, with no exit code, success=false and kind None. Faulted is
// reserved for failures of the gateway itself.
enum class ExecutionState {
    PENDING = 0,
    VALIDATING,
    REJECTED,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    FAULTED
};

const char* error_kind_name(ErrorKind kind);
const char* execution_state_name(ExecutionState state);

struct ExecutionRequest {
    std::string command;        // Raw command line, run through the shell
    std::string cwd;            // Caller-supplied working directory
    double timeout_seconds;     // 0 = wait for exit unconditionally

    ExecutionRequest() : timeout_seconds(0) {}
    ExecutionRequest(const std::string& cmd, const std::string& dir, double timeout = 0)
        : command(cmd), cwd(dir), timeout_seconds(timeout) {}

    // Longer timeouts are clamped to this (one year)
    static constexpr double MAX_TIMEOUT_SECONDS = 365.0 * 24 * 3600;

    bool has_timeout() const { return timeout_seconds > 0; }

    // Deadline offset in milliseconds, clamped to MAX_TIMEOUT_SECONDS
    int64_t timeout_ms() const;

    // Parse tool-call arguments {command, cwd, timeout?}. On failure returns
    // false and fills `error` with a message for the caller.
    static bool from_json(const Json& args, ExecutionRequest& out, std::string& error);
};

struct ExecutionResult {
    bool success;
    std::string output;         // Combined stdout/stderr, at most maxOutputSize bytes
    std::string error;          // Empty = absent
    bool has_exit_code;
    int exit_code;
    std::string command;        // Echo of the request
    bool truncated;             // Output hit the size cap
    ExecutionState state;
    ErrorKind kind;

    ExecutionResult()
        : success(false), has_exit_code(false), exit_code(0), truncated(false)
        , state(ExecutionState::PENDING), kind(ErrorKind::NONE) {}

    static ExecutionResult rejected(const std::string& command, ErrorKind kind, const std::string& message);
    static ExecutionResult completed(const std::string& command, int exit_code,
                                     const std::string& output, const std::string& stderr_text,
                                     bool truncated);
    static ExecutionResult signaled(const std::string& command, int signal_number,
                                    const std::string& output, bool truncated);
    static ExecutionResult timed_out(const std::string& command, double timeout_seconds,
                                     const std::string& output, bool truncated);
    static ExecutionResult faulted(const std::string& command, ErrorKind kind, const std::string& message,
                                   const std::string& output = "", bool truncated = false);

    // {success, output, error?, exitCode?, command, truncated?}
    Json to_json() const;
};

} // namespace bashgate

#endif // bashgate_GATE_EXECUTION_HPP
