#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace at {
/**
 * @brief Serializes a document, replacing invalid UTF-8 instead of throwing.
 *
 * Terminal output is arbitrary bytes, so every response body goes through
 * here rather than json::dump() directly.
 */
inline std::string dumpJson(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace at
