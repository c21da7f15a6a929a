#ifndef bashgate_CORE_JSON_HPP
#define bashgate_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace bashgate {

typedef nlohmann::json Json;

} // namespace bashgate

#endif // bashgate_CORE_JSON_HPP
