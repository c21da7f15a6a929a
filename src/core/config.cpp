#include <bashgate/core/config.hpp>
#include <bashgate/core/logger.hpp>
#include <bashgate/core/utils.hpp>

namespace bashgate {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        LOG_ERROR("Cannot open config file: %s", path.c_str());
        return false;
    }
    if (!load_string(text)) {
        LOG_ERROR("Invalid config file: %s", path.c_str());
        return false;
    }
    path_ = path;
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        LOG_ERROR("Config parse error: %s", e.what());
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("Config root must be a JSON object");
        return false;
    }
    root_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* v = find(key);
    if (!v || v->is_null()) return default_value;
    if (!v->is_string()) {
        LOG_WARN("Config key '%s' is not a string, using default", key.c_str());
        return default_value;
    }
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const Json* v = find(key);
    if (!v || v->is_null()) return default_value;
    if (!v->is_number_integer()) {
        LOG_WARN("Config key '%s' is not an integer, using default", key.c_str());
        return default_value;
    }
    return v->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* v = find(key);
    if (!v || v->is_null()) return default_value;
    if (!v->is_boolean()) {
        LOG_WARN("Config key '%s' is not a boolean, using default", key.c_str());
        return default_value;
    }
    return v->get<bool>();
}

} // namespace bashgate
