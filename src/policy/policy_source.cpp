#include <bashgate/policy/policy_source.hpp>
#include <bashgate/policy/policy.hpp>
#include <bashgate/core/utils.hpp>

#include <cerrno>
#include <cstring>

namespace bashgate {

std::string FilePolicySource::read(const std::string& location) const {
    std::string text;
    errno = 0;
    if (!read_file(location, text)) {
        std::string reason = errno != 0 ? strerror(errno) : "cannot open";
        throw ConfigError("cannot read policy file '" + location + "': " + reason);
    }
    return text;
}

} // namespace bashgate
