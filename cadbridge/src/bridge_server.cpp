#include "bridge_server.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace cadbridge {

BridgeServer::BridgeServer(BridgeContext& context)
    : context_(context), dispatcher_(context) {
    const BridgeConfig& config = context_.config;
    http_ = std::make_unique<HttpServer>(
        config.host, static_cast<uint16_t>(config.port),
        [this](const HttpRequest& request) { return actions::handle_http_request(dispatcher_, request); },
        static_cast<size_t>(config.worker_threads));
}

BridgeServer::~BridgeServer() {
    stop();
}

bool BridgeServer::start() {
    if (http_->is_running()) {
        LOG4CPLUS_INFO(server_logger(), "Bridge server already running on " << context_.config.host << ":" << port());
        return true;
    }

    if (!http_->start()) {
        const std::string message = "Failed to start bridge server on " + context_.config.host + ":" +
                                    std::to_string(context_.config.port);
        LOG4CPLUS_ERROR(server_logger(), message);
        context_.app.show_message(message);
        return false;
    }

    LOG4CPLUS_INFO(server_logger(), "Bridge server started on " << context_.config.host << ":" << port());
    return true;
}

void BridgeServer::stop() {
    const bool was_running = http_->is_running();
    // Always waits on the HTTP server so a concurrent stop() returns after teardown
    http_->stop();
    if (was_running) {
        LOG4CPLUS_INFO(server_logger(), "Bridge server stopped");
    }
}

bool BridgeServer::is_running() const {
    return http_->is_running();
}

uint16_t BridgeServer::port() const {
    return http_->port();
}

} // namespace cadbridge
