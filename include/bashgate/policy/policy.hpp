/*
 * bashgate C++17 - Command Policy
 *
 * A PolicySnapshot is the complete, immutable rule set one request is
 * validated against:
 *
 *   {
 *     "allowedCommands": ["ls", "pwd", ...],
 *     "allowedDirectories": ["/srv/work", ...],
 *     "validateCommandsStrictly": true,
 *     "maxOutputSize": 1048576
 *   }
 *
 * Snapshots are shared read-only between concurrent requests. A policy
 * change never edits one; it builds a new snapshot and swaps it in
 * (see PolicyStore).
 */
#ifndef bashgate_POLICY_POLICY_HPP
#define bashgate_POLICY_POLICY_HPP

#include <bashgate/core/json.hpp>
#include <set>
#include <string>
#include <stdexcept>
#include <cstddef>

namespace bashgate {

// Malformed or unreadable policy source
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class PolicySnapshot {
public:
    static const size_t DEFAULT_MAX_OUTPUT_SIZE = 1048576;

    // Directory entries must be absolute; they are stored normalized.
    // Throws ConfigError on a relative directory or a zero output cap.
    PolicySnapshot(const std::set<std::string>& allowed_commands,
                   const std::set<std::string>& allowed_directories,
                   bool strict_validation,
                   size_t max_output_size,
                   const std::string& digest = "");

    const std::set<std::string>& allowed_commands() const { return allowed_commands_; }
    const std::set<std::string>& allowed_directories() const { return allowed_directories_; }
    bool strict_validation() const { return strict_validation_; }
    size_t max_output_size() const { return max_output_size_; }

    // SHA-256 of the source text, empty for snapshots built in code
    const std::string& digest() const { return digest_; }

    bool allows_command(const std::string& name) const;

    // Build from the policy document. Throws ConfigError describing the
    // first problem found; nothing partial is ever returned.
    static PolicySnapshot from_json(const Json& doc, const std::string& digest = "");

    // Parse raw text (JSON) and record its digest
    static PolicySnapshot parse(const std::string& text);

private:
    std::set<std::string> allowed_commands_;
    std::set<std::string> allowed_directories_;
    bool strict_validation_;
    size_t max_output_size_;
    std::string digest_;
};

} // namespace bashgate

#endif // bashgate_POLICY_POLICY_HPP
