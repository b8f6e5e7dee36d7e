#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace cadbridge::codec {

/// Parses an HTTP request body into the params object. Empty body yields {}.
Result<nlohmann::json> decode_params(const std::string& body);

/// Action name from a request target: query dropped, slashes trimmed.
std::string action_from_target(const std::string& target);

const nlohmann::json* find_key(const nlohmann::json& object, const std::string& key);
std::string as_string(const nlohmann::json& value, const std::string& fallback = "");
int64_t as_int64(const nlohmann::json& value, int64_t fallback = 0);
bool as_bool(const nlohmann::json& value, bool fallback = false);

nlohmann::json error_to_json(const Error& error);
nlohmann::json success_envelope(nlohmann::json result);
nlohmann::json error_envelope(const Error& error);

/// Compact wire form; invalid UTF-8 in captured output is replaced, not thrown on.
std::string serialize(const nlohmann::json& value);

} // namespace cadbridge::codec
