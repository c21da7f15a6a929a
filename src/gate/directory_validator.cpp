#include <bashgate/gate/directory_validator.hpp>
#include <bashgate/core/utils.hpp>

#include <vector>

namespace bashgate {

std::string DirectoryValidator::normalize(const std::string& cwd) {
    return absolute_path(cwd);
}

Verdict DirectoryValidator::check(const PolicySnapshot& policy, const std::string& cwd) {
    const std::set<std::string>& allowed = policy.allowed_directories();

    // chdir() stops at the first NUL, so the path checked must be the path used
    if (!cwd.empty() && cwd.find('\0') == std::string::npos) {
        std::string path = normalize(cwd);
        for (std::set<std::string>::const_iterator it = allowed.begin(); it != allowed.end(); ++it) {
            if (is_same_or_descendant(path, *it)) {
                return Verdict::allow();
            }
        }
    }

    std::vector<std::string> dirs(allowed.begin(), allowed.end());
    std::string listing = dirs.empty() ? "(none)" : join(dirs, ", ");
    return Verdict::deny(ErrorKind::DIRECTORY_NOT_ALLOWED,
                         "Directory '" + escape_control(cwd) +
                         "' is not in the allowed directories list. Allowed directories "
                         "(subdirectories are also permitted): " + listing);
}

} // namespace bashgate
