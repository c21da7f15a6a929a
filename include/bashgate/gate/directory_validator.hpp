/*
 * bashgate C++17 - Directory Whitelist
 *
 * The requested cwd is made absolute and normalized lexically (".", ".."
 * and duplicate '/' collapse, no trailing '/'). Symlinks are NOT resolved,
 * so a link inside an allowed tree pointing elsewhere is not caught here.
 *
 * Matching is per path segment: "/home/x" is under "/home", "/home2/x" is
 * not.
 */
#ifndef bashgate_GATE_DIRECTORY_VALIDATOR_HPP
#define bashgate_GATE_DIRECTORY_VALIDATOR_HPP

#include "verdict.hpp"
#include <bashgate/policy/policy.hpp>
#include <string>

namespace bashgate {

class DirectoryValidator {
public:
    // Absolute, normalized form of `cwd` as used for matching and chdir
    static std::string normalize(const std::string& cwd);

    static Verdict check(const PolicySnapshot& policy, const std::string& cwd);
};

} // namespace bashgate

#endif // bashgate_GATE_DIRECTORY_VALIDATOR_HPP
