#include "core_context.hpp"

#include <stdexcept>

namespace cadbridge {

namespace {

bool parse_int(const std::string& text, int min_value, int max_value, int& out) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value < min_value || value > max_value) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool parse_bridge_flag(BridgeConfig& config, const std::string& flag, const std::string& value, std::string& error) {
    if (flag == "--host") {
        if (value.empty()) {
            error = "--host requires a value";
            return false;
        }
        config.host = value;
        return true;
    }
    if (flag == "--port") {
        if (!parse_int(value, 0, 65535, config.port)) {
            error = "Invalid port: " + value;
            return false;
        }
        return true;
    }
    if (flag == "--threads") {
        if (!parse_int(value, 1, 256, config.worker_threads)) {
            error = "Invalid thread count: " + value;
            return false;
        }
        return true;
    }
    if (flag == "--config") {
        config.log_config = value;
        return true;
    }
    error = "Unknown option: " + flag;
    return false;
}

} // namespace cadbridge
