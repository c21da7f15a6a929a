#include <bashgate/gate/execution.hpp>

#include <cstring>
#include <sstream>

namespace bashgate {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::CONFIG_ERROR: return "ConfigError";
        case ErrorKind::COMMAND_NOT_ALLOWED: return "CommandNotAllowed";
        case ErrorKind::DIRECTORY_NOT_ALLOWED: return "DirectoryNotAllowed";
        case ErrorKind::INJECTION_PATTERN_DETECTED: return "InjectionPatternDetected";
        case ErrorKind::SPAWN_FAILURE: return "SpawnFailure";
        case ErrorKind::TIMEOUT_EXCEEDED: return "TimeoutExceeded";
        case ErrorKind::INTERNAL_FAULT: return "InternalFault";
        default: return "Unknown";
    }
}

const char* execution_state_name(ExecutionState state) {
    switch (state) {
        case ExecutionState::PENDING: return "Pending";
        case ExecutionState::VALIDATING: return "Validating";
        case ExecutionState::REJECTED: return "Rejected";
        case ExecutionState::RUNNING: return "Running";
        case ExecutionState::COMPLETED: return "Completed";
        case ExecutionState::TIMED_OUT: return "TimedOut";
        case ExecutionState::FAULTED: return "Faulted";
        default: return "Unknown";
    }
}

// ============================================================================
// ExecutionRequest
// ============================================================================

bool ExecutionRequest::from_json(const Json& args, ExecutionRequest& out, std::string& error) {
    if (!args.is_object()) {
        error = "Missing arguments";
        return false;
    }

    Json::const_iterator cmd = args.find("command");
    Json::const_iterator cwd = args.find("cwd");
    if (cmd == args.end() || cwd == args.end() || cmd->is_null() || cwd->is_null()) {
        error = "Missing required command or cwd parameter";
        return false;
    }
    if (!cmd->is_string() || !cwd->is_string()) {
        error = "Parameters 'command' and 'cwd' must be strings";
        return false;
    }
    if (cmd->get<std::string>().empty() || cwd->get<std::string>().empty()) {
        error = "Missing required command or cwd parameter";
        return false;
    }

    double timeout = 0;
    Json::const_iterator t = args.find("timeout");
    if (t != args.end() && !t->is_null()) {
        if (!t->is_number()) {
            error = "Parameter 'timeout' must be a number of seconds";
            return false;
        }
        timeout = t->get<double>();
        if (timeout < 0) {
            error = "Parameter 'timeout' must be positive";
            return false;
        }
    }

    if (timeout > ExecutionRequest::MAX_TIMEOUT_SECONDS) {
        timeout = ExecutionRequest::MAX_TIMEOUT_SECONDS;
    }

    out.command = cmd->get<std::string>();
    out.cwd = cwd->get<std::string>();
    out.timeout_seconds = timeout;
    return true;
}

int64_t ExecutionRequest::timeout_ms() const {
    if (!has_timeout()) {
        return 0;
    }
    double seconds = timeout_seconds < MAX_TIMEOUT_SECONDS ? timeout_seconds : MAX_TIMEOUT_SECONDS;
    return static_cast<int64_t>(seconds * 1000.0);
}

// ============================================================================
// ExecutionResult
// ============================================================================

ExecutionResult ExecutionResult::rejected(const std::string& command, ErrorKind kind,
                                          const std::string& message) {
    ExecutionResult r;
    r.command = command;
    r.error = message;
    r.state = ExecutionState::REJECTED;
    r.kind = kind;
    return r;
}

ExecutionResult ExecutionResult::completed(const std::string& command, int exit_code,
                                           const std::string& output, const std::string& stderr_text,
                                           bool truncated) {
    ExecutionResult r;
    r.command = command;
    r.output = output;
    r.truncated = truncated;
    r.has_exit_code = true;
    r.exit_code = exit_code;
    r.success = (exit_code == 0);
    if (exit_code != 0 && !stderr_text.empty()) {
        r.error = stderr_text;
    }
    r.state = ExecutionState::COMPLETED;
    return r;
}

ExecutionResult ExecutionResult::signaled(const std::string& command, int signal_number,
                                          const std::string& output, bool truncated) {
    ExecutionResult r;
    r.command = command;
    r.output = output;
    r.truncated = truncated;

    std::ostringstream err;
    err << "Command terminated by signal " << signal_number;
    const char* name = strsignal(signal_number);
    if (name) {
        err << " (" << name << ")";
    }
    r.error = err.str();
    r.state = ExecutionState::COMPLETED;
    return r;
}

ExecutionResult ExecutionResult::timed_out(const std::string& command, double timeout_seconds,
                                           const std::string& output, bool truncated) {
    ExecutionResult r;
    r.command = command;
    r.output = output;
    r.truncated = truncated;

    std::ostringstream err;
    err << "Command execution timed out after " << timeout_seconds << " seconds";
    r.error = err.str();
    r.state = ExecutionState::TIMED_OUT;
    r.kind = ErrorKind::TIMEOUT_EXCEEDED;
    return r;
}

ExecutionResult ExecutionResult::faulted(const std::string& command, ErrorKind kind,
                                         const std::string& message,
                                         const std::string& output, bool truncated) {
    ExecutionResult r;
    r.command = command;
    r.error = message;
    r.output = output;
    r.truncated = truncated;
    r.state = ExecutionState::FAULTED;
    r.kind = kind;
    return r;
}

Json ExecutionResult::to_json() const {
    Json j = Json::object();
    j["success"] = success;
    j["output"] = output;
    if (!error.empty()) {
        j["error"] = error;
    }
    if (has_exit_code) {
        j["exitCode"] = exit_code;
    }
    j["command"] = command;
    if (truncated) {
        j["truncated"] = true;
    }
    return j;
}

} // namespace bashgate
