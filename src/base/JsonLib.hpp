#ifndef __TCODE_JSON_LIB__
#define __TCODE_JSON_LIB__

#include "Headers.hpp"
#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace tcode {
/** @brief Returns the string stored under `key`, if `obj` has one. */
inline optional<string> jsonString(const json &obj, const string &key) {
  if (!obj.is_object()) {
    return nullopt;
  }
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return nullopt;
  }
  return it->get<string>();
}

/** @brief Returns the integer stored under `key`, if `obj` has one. */
inline optional<int64_t> jsonInteger(const json &obj, const string &key) {
  if (!obj.is_object()) {
    return nullopt;
  }
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_integer()) {
    return nullopt;
  }
  return it->get<int64_t>();
}

/** @brief Reads an array of strings, skipping anything that is not one. */
inline vector<string> jsonStringArray(const json &obj, const string &key) {
  vector<string> retval;
  if (!obj.is_object()) {
    return retval;
  }
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_array()) {
    return retval;
  }
  for (const auto &element : *it) {
    if (element.is_string()) {
      retval.push_back(element.get<string>());
    }
  }
  return retval;
}
}  // namespace tcode

#endif  // __TCODE_JSON_LIB__
