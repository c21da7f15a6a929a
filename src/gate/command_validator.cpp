#include <bashgate/gate/command_validator.hpp>
#include <bashgate/core/utils.hpp>

#include <cctype>
#include <vector>

namespace bashgate {

std::string CommandValidator::base_command(const std::string& command) {
    std::string trimmed = trim(command);
    size_t end = 0;
    while (end < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[end]))) {
        ++end;
    }
    return trimmed.substr(0, end);
}

Verdict CommandValidator::check(const PolicySnapshot& policy, const std::string& command) {
    std::string base = base_command(command);

    // std::set iterates sorted, so the listing is stable across calls
    std::vector<std::string> allowed(policy.allowed_commands().begin(),
                                     policy.allowed_commands().end());
    std::string listing = allowed.empty() ? "(none)" : join(allowed, ", ");

    if (base.empty()) {
        return Verdict::deny(ErrorKind::COMMAND_NOT_ALLOWED,
                             "Empty command. Allowed commands: " + listing);
    }

    if (!policy.allows_command(base)) {
        return Verdict::deny(ErrorKind::COMMAND_NOT_ALLOWED,
                             "Command '" + escape_control(base) +
                             "' is not in the allowed commands list. Allowed commands: " + listing);
    }

    return Verdict::allow();
}

} // namespace bashgate
