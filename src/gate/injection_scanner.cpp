#include <bashgate/gate/injection_scanner.hpp>
#include <bashgate/core/utils.hpp>

namespace bashgate {

const std::vector<std::string>& InjectionScanner::patterns() {
    // Two-character sequences precede their one-character prefixes so the
    // more specific one is reported ("||" rather than "|")
    static const std::vector<std::string> list = {
        ";", "&&", "||", "`", "$(", "|", ">", "<", "\n"
    };
    return list;
}

std::string InjectionScanner::find_pattern(const std::string& command) {
    const std::vector<std::string>& list = patterns();
    for (size_t i = 0; i < list.size(); ++i) {
        if (command.find(list[i]) != std::string::npos) {
            return list[i];
        }
    }
    return "";
}

Verdict InjectionScanner::check(const PolicySnapshot& policy, const std::string& command) {
    if (!policy.strict_validation()) {
        return Verdict::allow();
    }

    std::string found = find_pattern(command);
    if (found.empty()) {
        return Verdict::allow();
    }

    std::vector<std::string> shown;
    const std::vector<std::string>& list = patterns();
    for (size_t i = 0; i < list.size(); ++i) {
        shown.push_back(escape_control(list[i]));
    }

    return Verdict::deny(ErrorKind::INJECTION_PATTERN_DETECTED,
                         "Potential command injection detected: '" + escape_control(found) +
                         "'. Strict validation rejects these sequences: " + join(shown, " ") +
                         ". Run a single command without chaining, substitution, pipes or redirection.");
}

} // namespace bashgate
