#include "bridge_server.hpp"
#include "core_context.hpp"
#include "host/event_loop_host.hpp"
#include "logger.hpp"
#include "script/quickjs_engine.hpp"
#include "transaction_executor.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_stop_requested{false};

void on_signal(int) {
    g_stop_requested = true;
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--host H] [--port P] [--threads N] [--config log4cplus.ini] [--document NAME] [--version]"
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    cadbridge::BridgeConfig config;
    cadbridge::host::HostOptions host_options;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << CADBRIDGE_VERSION_STRING << std::endl;
            std::cout << "Commit: " << CADBRIDGE_GIT_VERSION << std::endl;
            std::cout << "Build Time: " << CADBRIDGE_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        std::string flag = argv[i];
        std::string value;
        auto eq = flag.find('=');
        if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            std::cerr << "Missing value for " << flag << std::endl;
            print_usage(argv[0]);
            return 2;
        }

        if (flag == "--document") {
            host_options.document_name = value;
            continue;
        }

        std::string error;
        if (!cadbridge::parse_bridge_flag(config, flag, value, error)) {
            std::cerr << error << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    cadbridge::init_logging(config.log_config);

    LOG4CPLUS_INFO(cadbridge::core_logger(), "cadbridge_host starting");
    LOG4CPLUS_INFO(cadbridge::core_logger(), "Version: " << CADBRIDGE_VERSION_STRING << ", Commit: " << CADBRIDGE_GIT_VERSION);
    LOG4CPLUS_INFO(cadbridge::core_logger(), "Build Time: " << CADBRIDGE_BUILD_TIMESTAMP);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    cadbridge::host::EventLoopHost host(host_options);
    cadbridge::script::QuickJsEngine engine;
    cadbridge::TransactionExecutor executor(host, engine);
    cadbridge::BridgeContext context{config, host, executor};

    cadbridge::BridgeServer server(context);
    if (!server.start()) {
        LOG4CPLUS_ERROR(cadbridge::core_logger(), "Failed to start bridge server");
        return 1;
    }

    host.run_until([] { return g_stop_requested.load(); });

    LOG4CPLUS_INFO(cadbridge::core_logger(), "Shutting down");
    host.stop();
    server.stop();
    return 0;
}
