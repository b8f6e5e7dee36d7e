#pragma once

#include "host/host_api.hpp"
#include "transaction_executor.hpp"

#include <string>

namespace cadbridge {

struct BridgeConfig {
    std::string host = "localhost";
    int port = 3600;
    int worker_threads = 4;
    std::string log_config = "log4cplus.ini";
};

/// Parses bridge flags; unknown flags are left for the caller. Returns false on a bad value.
bool parse_bridge_flag(BridgeConfig& config, const std::string& flag, const std::string& value, std::string& error);

/**
 * Everything an action needs, passed explicitly from main.
 */
struct BridgeContext {
    BridgeConfig config;
    host::Application& app;
    TransactionExecutor& executor;
};

} // namespace cadbridge
