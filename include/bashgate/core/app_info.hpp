#ifndef bashgate_CORE_APP_INFO_HPP
#define bashgate_CORE_APP_INFO_HPP

namespace bashgate {

struct AppInfo {
    static constexpr const char* NAME = "bashgate";
    static constexpr const char* VERSION = "0.1.0";
    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";
};

} // namespace bashgate

#endif // bashgate_CORE_APP_INFO_HPP
