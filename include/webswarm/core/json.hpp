/*
 * webswarm - JSON value type
 *
 * All wire payloads (worker execution, automation RPC envelopes, oracle
 * output, status events) are represented as nlohmann::json.
 */
#ifndef WEBSWARM_CORE_JSON_HPP
#define WEBSWARM_CORE_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace webswarm {

typedef nlohmann::json Json;

// Parse without throwing. Returns a discarded value on malformed input.
inline Json parse_json_lenient(const std::string& text) {
    return Json::parse(text, nullptr, false);
}

// Locate a JSON object embedded in free text: a ```json fenced block first,
// then the first balanced {...} span. Returns an empty string if none.
std::string extract_json_block(const std::string& text);

// Typed getters with defaults, tolerant of missing keys and wrong types.
std::string json_string(const Json& obj, const std::string& key, const std::string& def = "");
int64_t json_int(const Json& obj, const std::string& key, int64_t def = 0);
bool json_bool(const Json& obj, const std::string& key, bool def = false);

} // namespace webswarm

#endif // WEBSWARM_CORE_JSON_HPP
