#include "bridge_client.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <utility>

namespace cadbridge::client {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kConnectionMessage =
    "Cannot connect to the CAD host add-in. Ask the user to check that the add-in is running.";
constexpr const char* kTimeoutMessage =
    "The CAD host took too long to respond. The host may be busy or the operation too large; "
    "split it into smaller calls.";
constexpr const char* kResponseMessage =
    "Received an invalid response from the CAD host add-in. Check that the add-in and the client are the same version.";

enum class Stage { Resolve, Connect, Write, Read };

Error classify(Stage stage, const beast::error_code& ec) {
    if (ec == beast::error::timeout) {
        return make_error(ErrorKind::TimeoutError, kTimeoutMessage);
    }
    if (stage == Stage::Resolve || stage == Stage::Connect) {
        return make_error(ErrorKind::ConnectionError, kConnectionMessage);
    }
    return make_error(ErrorKind::RequestError,
                      "Network error while communicating with the CAD host add-in: " + ec.message());
}

nlohmann::json error_field(const nlohmann::json& envelope, const std::string& default_type, const std::string& default_message) {
    nlohmann::json error = nlohmann::json::object();
    const nlohmann::json* error_obj = codec::find_key(envelope, "error");
    if (error_obj && error_obj->is_object()) {
        error = *error_obj;
    }
    if (!error.contains("type") || !error["type"].is_string()) {
        error["type"] = default_type;
    }
    if (!error.contains("message") || !error["message"].is_string()) {
        error["message"] = default_message;
    }
    return error;
}

} // namespace

BridgeClient::BridgeClient(ClientOptions options) : options_(std::move(options)) {}

std::string BridgeClient::base_url() const {
    return "http://" + options_.host + ":" + std::to_string(options_.port);
}

Result<BridgeClient::Exchange> BridgeClient::post(const std::string& target, const std::string& body) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;

    http::request<http::string_body> request{http::verb::post, target, 11};
    request.set(http::field::host, options_.host);
    request.set(http::field::user_agent, "cadbridge-client");
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();

    http::response<http::string_body> response;

    bool completed = false;
    Stage stage = Stage::Resolve;
    beast::error_code failure;

    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    auto fail = [&](Stage at, const beast::error_code& ec) {
        stage = at;
        failure = ec;
        completed = true;
    };

    resolver.async_resolve(options_.host, std::to_string(options_.port),
        [&](const beast::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                fail(Stage::Resolve, ec);
                return;
            }
            stream.expires_at(deadline);
            stream.async_connect(results, [&](const beast::error_code& ec, const tcp::endpoint&) {
                if (ec) {
                    fail(Stage::Connect, ec);
                    return;
                }
                http::async_write(stream, request, [&](const beast::error_code& ec, std::size_t) {
                    if (ec) {
                        fail(Stage::Write, ec);
                        return;
                    }
                    http::async_read(stream, buffer, response, [&](const beast::error_code& ec, std::size_t) {
                        if (ec) {
                            fail(Stage::Read, ec);
                            return;
                        }
                        completed = true;
                    });
                });
            });
        });

    ioc.run_for(options_.timeout);

    if (!completed) {
        // Resolution outlived the deadline; the stream timer covers the later stages
        LOG4CPLUS_WARN(client_logger(), "POST " << target << " exceeded " << options_.timeout.count() << " ms");
        return make_error(ErrorKind::TimeoutError, kTimeoutMessage);
    }
    if (failure) {
        LOG4CPLUS_WARN(client_logger(), "POST " << target << " failed: " << failure.message());
        return classify(stage, failure);
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    Exchange exchange;
    exchange.status = response.result_int();
    exchange.body = std::move(response.body());
    return exchange;
}

nlohmann::json BridgeClient::interpret(const std::string& action, const Exchange& exchange) {
    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(exchange.body);
    } catch (const nlohmann::json::parse_error& exc) {
        LOG4CPLUS_ERROR(client_logger(), "Invalid JSON from " << action << ": " << exc.what());
        return codec::error_envelope(make_error(ErrorKind::ResponseParseError, kResponseMessage));
    }

    const nlohmann::json* success = codec::find_key(envelope, "success");
    if (!envelope.is_object() || !success || !success->is_boolean()) {
        LOG4CPLUS_ERROR(client_logger(), "Malformed envelope from " << action << ": " << exchange.body);
        return codec::error_envelope(make_error(ErrorKind::ResponseParseError, kResponseMessage));
    }

    if (exchange.status == 200) {
        if (success->get<bool>()) {
            return envelope;
        }
        nlohmann::json error = error_field(envelope, "FusionServerError", "An unknown error occurred");
        LOG4CPLUS_ERROR(client_logger(), "Action '" << action << "' failed: " << error.dump());
        return nlohmann::json{{"success", false}, {"error", error}};
    }

    nlohmann::json error = error_field(envelope, type_tag(ErrorKind::ServerError),
                                       "Server returned status " + std::to_string(exchange.status));
    error["message"] = "HTTP " + std::to_string(exchange.status) + ": " + error["message"].get<std::string>();
    LOG4CPLUS_ERROR(client_logger(), "Action '" << action << "' failed with HTTP " << exchange.status);
    return nlohmann::json{{"success", false}, {"error", error}};
}

nlohmann::json BridgeClient::call_action(const std::string& action, const nlohmann::json& params) {
    const std::string target = "/" + action;
    LOG4CPLUS_INFO(client_logger(), "Calling action '" << action << "' at " << base_url() << target);

    try {
        Result<Exchange> exchange = post(target, codec::serialize(params));
        if (is_error(exchange)) {
            return codec::error_envelope(get_error(exchange));
        }
        return interpret(action, get_value(exchange));
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(client_logger(), "Unexpected error calling '" << action << "': " << exc.what());
        return codec::error_envelope(make_error(
            ErrorKind::UnknownError,
            std::string("An unexpected error occurred in the bridge client. Details: ") + exc.what()));
    }
}

nlohmann::json BridgeClient::execute_code(const std::string& code, const std::string& description) {
    nlohmann::json params{{"code", code}};
    if (!description.empty()) {
        params["transaction_name"] = description;
    }

    nlohmann::json envelope = call_action("execute_code", params);
    if (codec::as_bool(envelope["success"])) {
        return nlohmann::json{{"result", envelope.value("result", nlohmann::json(""))}};
    }
    return nlohmann::json{{"error", envelope["error"]}};
}

} // namespace cadbridge::client
