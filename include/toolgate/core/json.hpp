#ifndef toolgate_CORE_JSON_HPP
#define toolgate_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace toolgate {

typedef nlohmann::json Json;

} // namespace toolgate

#endif // toolgate_CORE_JSON_HPP
