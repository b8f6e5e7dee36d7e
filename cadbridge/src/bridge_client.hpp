#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace cadbridge::client {

struct ClientOptions {
    std::string host = "localhost";
    uint16_t port = 3600;
    std::chrono::milliseconds timeout{10000};
};

/**
 * Calls named actions on a running bridge server. Every outcome, including
 * transport failures, comes back as a response envelope:
 * {"success": true, "result": ...} or {"success": false, "error": {type, message}}.
 */
class BridgeClient {
public:
    explicit BridgeClient(ClientOptions options = {});

    nlohmann::json call_action(const std::string& action, const nlohmann::json& params = nlohmann::json::object());

    /// {"result": <output>} on success, {"error": {type, message}} otherwise.
    nlohmann::json execute_code(const std::string& code, const std::string& description = "");

    std::string base_url() const;
    const ClientOptions& options() const { return options_; }

private:
    struct Exchange {
        unsigned status = 0;
        std::string body;
    };

    ClientOptions options_;

    Result<Exchange> post(const std::string& target, const std::string& body);
    nlohmann::json interpret(const std::string& action, const Exchange& exchange);
};

} // namespace cadbridge::client
