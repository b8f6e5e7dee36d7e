#include "bridge_client.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--host H] [--port P] [--timeout-ms N] [--config log4cplus.ini] <action> [json-params]\n"
              << "       " << argv0 << " [options] execute_code --code <script> [--description TEXT]" << std::endl;
}

bool parse_number(const std::string& text, long min_value, long max_value, long& out) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size() || value < min_value || value > max_value) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void print_failure(const nlohmann::json& error) {
    std::cerr << "[" << error.value("type", "UnknownError") << "] " << error.value("message", "") << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    cadbridge::client::ClientOptions options;
    std::string config_path;
    std::string action;
    std::string params_text;
    std::string code;
    std::string description;
    bool has_code = false;

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

        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return 2;
            }
            std::string value = argv[++i];
            long number = 0;
            if (arg == "--host") {
                options.host = value;
            } else if (arg == "--port") {
                if (!parse_number(value, 1, 65535, number)) {
                    std::cerr << "Invalid port: " << value << std::endl;
                    return 2;
                }
                options.port = static_cast<uint16_t>(number);
            } else if (arg == "--timeout-ms") {
                if (!parse_number(value, 1, 24L * 3600 * 1000, number)) {
                    std::cerr << "Invalid timeout: " << value << std::endl;
                    return 2;
                }
                options.timeout = std::chrono::milliseconds(number);
            } else if (arg == "--config") {
                config_path = value;
            } else if (arg == "--code") {
                code = value;
                has_code = true;
            } else if (arg == "--description") {
                description = value;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 2;
            }
            continue;
        }

        if (action.empty()) {
            action = arg;
        } else if (params_text.empty()) {
            params_text = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (action.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    // Quiet console by default; a config file can turn logging up.
    cadbridge::init_logging(config_path);
    if (config_path.empty()) {
        log4cplus::Logger::getRoot().setLogLevel(log4cplus::WARN_LOG_LEVEL);
    }

    cadbridge::client::BridgeClient client(options);

    if (has_code) {
        if (action != "execute_code") {
            std::cerr << "--code is only valid with execute_code" << std::endl;
            return 2;
        }
        nlohmann::json outcome = client.execute_code(code, description);
        std::cout << outcome.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        if (outcome.contains("error")) {
            print_failure(outcome["error"]);
            return 1;
        }
        return 0;
    }

    nlohmann::json params = nlohmann::json::object();
    if (!params_text.empty()) {
        try {
            params = nlohmann::json::parse(params_text);
        } catch (const nlohmann::json::parse_error& exc) {
            std::cerr << "Invalid JSON params: " << exc.what() << std::endl;
            return 2;
        }
        if (!params.is_object()) {
            std::cerr << "Params must be a JSON object" << std::endl;
            return 2;
        }
    }

    nlohmann::json envelope = client.call_action(action, params);
    std::cout << envelope.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    if (envelope.value("success", false)) {
        return 0;
    }
    print_failure(envelope["error"]);
    return 1;
}
