#pragma once

#include "action/action.hpp"
#include "core_context.hpp"
#include "http_server.hpp"

#include <memory>

namespace cadbridge {

/**
 * Owns the dispatcher and the HTTP listener for one host process.
 */
class BridgeServer {
public:
    explicit BridgeServer(BridgeContext& context);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    bool start();
    void stop();
    bool is_running() const;
    uint16_t port() const;

    actions::Dispatcher& dispatcher() { return dispatcher_; }

private:
    BridgeContext& context_;
    actions::Dispatcher dispatcher_;
    std::unique_ptr<HttpServer> http_;
};

} // namespace cadbridge
