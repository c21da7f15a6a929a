/*
 * bashgate C++17 - Service Configuration
 *
 * JSON-backed settings with dotted-key lookups ("executor.shell").
 * Every getter takes a default, so a missing file or key is never an error;
 * a key present with the wrong type is logged and the default returned.
 *
 * This covers the service itself (log level, shell, workers). The command
 * policy lives in its own file and is handled by PolicyStore.
 */
#ifndef bashgate_CORE_CONFIG_HPP
#define bashgate_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace bashgate {

class Config {
public:
    Config();

    // Returns false (and logs) if the file is unreadable or not a JSON object
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_value) const;
    int64_t get_int(const std::string& key, int64_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;


    bool has(const std::string& key) const;

    const std::string& path() const { return path_; }

private:
    const Json* find(const std::string& key) const;

    Json root_;
    std::string path_;
};

} // namespace bashgate

#endif // bashgate_CORE_CONFIG_HPP
