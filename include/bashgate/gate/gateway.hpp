/*
 * bashgate C++17 - Gateway
 *
 * Single entry point for one command request:
 *
 *   snapshot = store.get()                 (once per request)
 *   CommandValidator -> InjectionScanner -> DirectoryValidator
 *   Executor::run in the normalized directory
 *
 * The first denial wins and nothing is spawned. Every outcome, including
 * internal failures, comes back as an ExecutionResult; execute() does not
 * throw.
 */
#ifndef bashgate_GATE_GATEWAY_HPP
#define bashgate_GATE_GATEWAY_HPP

#include "execution.hpp"
#include "executor.hpp"
#include <bashgate/policy/policy_store.hpp>
#include <string>

namespace bashgate {

class Gateway {
public:
    explicit Gateway(PolicyStore& store, const ExecutorOptions& options = ExecutorOptions());

    ExecutionResult execute(const ExecutionRequest& request) const;

    // Hot-reload hook: re-read the policy at `location`. Returns false and
    // keeps the active policy if the new one is invalid.
    bool reload(const std::string& location);

private:
    PolicyStore& store_;
    ExecutorOptions options_;
};

} // namespace bashgate

#endif // bashgate_GATE_GATEWAY_HPP
