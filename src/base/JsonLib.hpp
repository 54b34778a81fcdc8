#pragma once

#include "Headers.hpp"
#include "nlohmann/json.hpp"

namespace agt {
/**
 * @brief Exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

/**
 * @brief Compact serialization for the wire. Strings that are not valid
 * UTF-8 are written with U+FFFD instead of throwing.
 */
inline string toWireString(const json& message) {
  return message.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace agt
