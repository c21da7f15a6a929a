/*
 * bashgate C++17 - Policy Source
 *
 * Where policy text comes from. The store only needs "give me the text
 * stored at this location"; files are the default medium.
 */
#ifndef bashgate_POLICY_POLICY_SOURCE_HPP
#define bashgate_POLICY_POLICY_SOURCE_HPP

#include <string>

namespace bashgate {

class PolicySource {
public:
    virtual ~PolicySource() {}

    // Returns the raw policy text. Throws ConfigError if it cannot be read.
    virtual std::string read(const std::string& location) const = 0;
};

class FilePolicySource : public PolicySource {
public:
    std::string read(const std::string& location) const override;
};

} // namespace bashgate

#endif // bashgate_POLICY_POLICY_SOURCE_HPP
