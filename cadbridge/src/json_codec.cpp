#include "json_codec.hpp"

#include <utility>

namespace cadbridge::codec {

Result<nlohmann::json> decode_params(const std::string& body) {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json::object();
    }

    nlohmann::json params;
    try {
        params = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& exc) {
        return make_bad_request(std::string("Invalid JSON format: ") + exc.what());
    }

    if (!params.is_object()) {
        return make_bad_request("Request body must be a JSON object");
    }
    return params;
}

std::string action_from_target(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    auto first = path.find_first_not_of('/');
    if (first == std::string::npos) {
        return "";
    }
    auto last = path.find_last_not_of('/');
    return path.substr(first, last - first + 1);
}

const nlohmann::json* find_key(const nlohmann::json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &(*it);
}

std::string as_string(const nlohmann::json& value, const std::string& fallback) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const nlohmann::json& value, int64_t fallback) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    return fallback;
}

bool as_bool(const nlohmann::json& value, bool fallback) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    return fallback;
}

nlohmann::json error_to_json(const Error& error) {
    return nlohmann::json{{"type", type_tag(error.kind)}, {"message", error.message}};
}

nlohmann::json success_envelope(nlohmann::json result) {
    nlohmann::json envelope = nlohmann::json::object();
    envelope["success"] = true;
    envelope["result"] = std::move(result);
    return envelope;
}

nlohmann::json error_envelope(const Error& error) {
    return nlohmann::json{{"success", false}, {"error", error_to_json(error)}};
}

std::string serialize(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cadbridge::codec
