#ifndef __FSN_JSON_LIB__
#define __FSN_JSON_LIB__

#include <string>

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for helper payloads.
 */
using json = nlohmann::json;

namespace fsn {
/**
 * @brief Parses a helper payload without throwing.
 * @return false when the payload is not valid JSON.
 */
inline bool tryParseJson(const std::string& payload, json* out) {
  json parsed = json::parse(payload, nullptr, false);
  if (parsed.is_discarded()) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

/** @brief Renders a JSON value as text for messages, unquoting strings. */
inline std::string jsonToMessage(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}
}  // namespace fsn

#endif  // __FSN_JSON_LIB__
