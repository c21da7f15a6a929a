/*
 * bashgate C++17 - Command Whitelist
 *
 * Only the base command (first whitespace-delimited token of the trimmed
 * command line) is checked. Quoting, "VAR=x cmd" prefixes and the rest of
 * the shell grammar are not interpreted; anything after the first token is
 * left to InjectionScanner. Keep the two in step if this ever changes.
 */
#ifndef bashgate_GATE_COMMAND_VALIDATOR_HPP
#define bashgate_GATE_COMMAND_VALIDATOR_HPP

#include "verdict.hpp"
#include <bashgate/policy/policy.hpp>
#include <string>

namespace bashgate {

class CommandValidator {
public:
    // First token of the trimmed command, or "" for a blank command
    static std::string base_command(const std::string& command);

    static Verdict check(const PolicySnapshot& policy, const std::string& command);
};

} // namespace bashgate

#endif // bashgate_GATE_COMMAND_VALIDATOR_HPP
