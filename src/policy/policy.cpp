/*
 * bashgate C++17 - Command Policy Implementation
 */
#include <bashgate/policy/policy.hpp>
#include <bashgate/core/logger.hpp>
#include <bashgate/core/utils.hpp>

namespace bashgate {

const size_t PolicySnapshot::DEFAULT_MAX_OUTPUT_SIZE;

namespace {

const char* const KEY_COMMANDS = "allowedCommands";
const char* const KEY_DIRECTORIES = "allowedDirectories";
const char* const KEY_STRICT = "validateCommandsStrictly";
const char* const KEY_MAX_OUTPUT = "maxOutputSize";

std::set<std::string> read_string_list(const Json& doc, const char* key) {
    Json::const_iterator it = doc.find(key);
    if (it == doc.end()) {
        throw ConfigError(std::string("missing required field '") + key + "'");
    }
    if (!it->is_array()) {
        throw ConfigError(std::string("'") + key + "' must be a list of strings");
    }

    std::set<std::string> values;
    for (size_t i = 0; i < it->size(); ++i) {
        const Json& item = (*it)[i];
        if (!item.is_string()) {
            throw ConfigError(std::string("'") + key + "' must be a list of strings (entry " +
                              std::to_string(i) + " is " + item.type_name() + ")");
        }
        std::string value = item.get<std::string>();
        if (value.empty()) {
            throw ConfigError(std::string("'") + key + "' entry " + std::to_string(i) + " is empty");
        }
        values.insert(value);
    }
    return values;
}

} // namespace

PolicySnapshot::PolicySnapshot(const std::set<std::string>& allowed_commands,
                               const std::set<std::string>& allowed_directories,
                               bool strict_validation,
                               size_t max_output_size,
                               const std::string& digest)
    : allowed_commands_(allowed_commands)
    , strict_validation_(strict_validation)
    , max_output_size_(max_output_size)
    , digest_(digest)
{
    if (max_output_size_ == 0) {
        throw ConfigError("'maxOutputSize' must be a positive integer");
    }
    for (std::set<std::string>::const_iterator it = allowed_directories.begin();
         it != allowed_directories.end(); ++it) {
        if (it->find('\0') != std::string::npos) {
            throw ConfigError("allowed directory '" + escape_control(*it) + "' contains a NUL byte");
        }
        if (!is_absolute_path(*it)) {
            throw ConfigError("allowed directory '" + *it + "' is not an absolute path");
        }
        allowed_directories_.insert(normalize_path(*it));
    }
}

bool PolicySnapshot::allows_command(const std::string& name) const {
    return allowed_commands_.count(name) > 0;
}

PolicySnapshot PolicySnapshot::from_json(const Json& doc, const std::string& digest) {
    if (!doc.is_object()) {
        throw ConfigError("policy must be a JSON object");
    }

    std::set<std::string> commands = read_string_list(doc, KEY_COMMANDS);
    std::set<std::string> directories = read_string_list(doc, KEY_DIRECTORIES);

    bool strict = true;
    Json::const_iterator strict_it = doc.find(KEY_STRICT);
    if (strict_it != doc.end()) {
        if (!strict_it->is_boolean()) {
            throw ConfigError(std::string("'") + KEY_STRICT + "' must be a boolean");
        }
        strict = strict_it->get<bool>();
    }

    size_t max_output = DEFAULT_MAX_OUTPUT_SIZE;
    Json::const_iterator max_it = doc.find(KEY_MAX_OUTPUT);
    if (max_it != doc.end()) {
        if (max_it->is_number_unsigned()) {
            max_output = max_it->get<size_t>();
        } else if (max_it->is_number_integer() && max_it->get<int64_t>() > 0) {
            max_output = static_cast<size_t>(max_it->get<int64_t>());
        } else {
            throw ConfigError(std::string("'") + KEY_MAX_OUTPUT + "' must be a positive integer");
        }
        if (max_output == 0) {
            throw ConfigError(std::string("'") + KEY_MAX_OUTPUT + "' must be a positive integer");
        }
    }

    for (Json::const_iterator it = doc.begin(); it != doc.end(); ++it) {
        if (it.key() != KEY_COMMANDS && it.key() != KEY_DIRECTORIES &&
            it.key() != KEY_STRICT && it.key() != KEY_MAX_OUTPUT) {
            LOG_DEBUG("Ignoring unknown policy field '%s'", it.key().c_str());
        }
    }

    return PolicySnapshot(commands, directories, strict, max_output, digest);
}

PolicySnapshot PolicySnapshot::parse(const std::string& text) {
    Json doc;
    try {
        doc = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw ConfigError(std::string("policy is not valid JSON: ") + e.what());
    }
    return from_json(doc, sha256_hex(text));
}

} // namespace bashgate
