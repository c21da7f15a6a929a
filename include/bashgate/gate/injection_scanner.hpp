/*
 * bashgate C++17 - Injection Pattern Scanner
 *
 * The whitelist only sees the first token, so "ls; rm -rf /" would pass it.
 * With validateCommandsStrictly=true this scanner rejects any command line
 * containing a sequence that chains, substitutes or redirects:
 *
 *   ;  &&  ||  `  $(  |  >  <  newline
 *
 * With validateCommandsStrictly=false the scan is skipped and pipes and
 * redirection reach the shell; that is the policy author's call.
 */
#ifndef bashgate_GATE_INJECTION_SCANNER_HPP
#define bashgate_GATE_INJECTION_SCANNER_HPP

#include "verdict.hpp"
#include <bashgate/policy/policy.hpp>
#include <string>
#include <vector>

namespace bashgate {

class InjectionScanner {
public:
    // The sequences checked, in reporting order
    static const std::vector<std::string>& patterns();

    // First pattern found in `command`, or "" if none
    static std::string find_pattern(const std::string& command);

    static Verdict check(const PolicySnapshot& policy, const std::string& command);
};

} // namespace bashgate

#endif // bashgate_GATE_INJECTION_SCANNER_HPP
