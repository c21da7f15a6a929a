#include <bashgate/gate/gateway.hpp>
#include <bashgate/gate/command_validator.hpp>
#include <bashgate/gate/directory_validator.hpp>
#include <bashgate/gate/injection_scanner.hpp>
#include <bashgate/core/logger.hpp>
#include <bashgate/core/utils.hpp>

#include <exception>
#include <memory>

namespace bashgate {

Gateway::Gateway(PolicyStore& store, const ExecutorOptions& options)
    : store_(store)
    , options_(options)
{}

ExecutionResult Gateway::execute(const ExecutionRequest& request) const {
    std::string id = generate_request_id();

    std::shared_ptr<const PolicySnapshot> policy = store_.get();
    if (!policy) {
        LOG_ERROR("[%s] No policy loaded, refusing '%s'", id.c_str(),
                  escape_control(request.command).c_str());
        return ExecutionResult::faulted(request.command, ErrorKind::INTERNAL_FAULT,
                                        "Internal error: no policy is loaded");
    }

    LOG_DEBUG("[%s] Validating '%s' in '%s' (policy %.12s)", id.c_str(),
              escape_control(request.command).c_str(), escape_control(request.cwd).c_str(),
              policy->digest().c_str());

    Verdict verdict = CommandValidator::check(*policy, request.command);
    if (verdict.allowed) {
        verdict = InjectionScanner::check(*policy, request.command);
    }
    if (verdict.allowed) {
        verdict = DirectoryValidator::check(*policy, request.cwd);
    }
    if (!verdict.allowed) {
        LOG_WARN("[%s] Rejected (%s): %s", id.c_str(), error_kind_name(verdict.kind),
                 escape_control(request.command).c_str());
        return ExecutionResult::rejected(request.command, verdict.kind, verdict.message);
    }

    std::string workdir = DirectoryValidator::normalize(request.cwd);
    LOG_INFO("[%s] Running '%s' in %s", id.c_str(), escape_control(request.command).c_str(),
             workdir.c_str());

    try {
        Executor executor(options_);
        ExecutionResult result = executor.run(request, workdir, policy->max_output_size());
        if (result.has_exit_code) {
            LOG_INFO("[%s] Finished: %s (exit %d)", id.c_str(),
                     execution_state_name(result.state), result.exit_code);
        } else {
            LOG_INFO("[%s] Finished: %s", id.c_str(), execution_state_name(result.state));
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("[%s] Executor failed: %s", id.c_str(), e.what());
        return ExecutionResult::faulted(request.command, ErrorKind::INTERNAL_FAULT,
                                        std::string("Internal error: ") + e.what());
    }
}

bool Gateway::reload(const std::string& location) {
    return store_.reload(location);
}

} // namespace bashgate
