#ifndef __PV_JSON_LIB__
#define __PV_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace pv {
/**
 * @brief Serializes without throwing on invalid UTF-8 (terminal output is
 * arbitrary bytes); bad sequences become U+FFFD.
 */
inline std::string dumpJson(const json& j, int indent = -1) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}
}  // namespace pv

#endif  // __PV_JSON_LIB__
