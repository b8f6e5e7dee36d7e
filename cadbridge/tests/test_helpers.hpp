#pragma once

#include "script/script_engine.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/// Returns a loopback port nothing is listening on.
uint16_t unused_local_port();

/**
 * Raw-socket HTTP endpoint on 127.0.0.1 with a scripted reply.
 * A silent stub reads the request and never answers.
 */
class StubHttpServer {
public:
    StubHttpServer();
    ~StubHttpServer();

    void reply_with(unsigned status, std::string body);
    void go_silent();

    bool start();
    void stop();
    uint16_t port() const { return port_; }

    std::vector<std::string> requests() const;

private:
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    unsigned status_ = 200;
    std::string body_;
    bool silent_ = false;
    std::vector<std::string> requests_;
    std::vector<int> held_fds_;

    void serve();
    void serve_client(int client_fd);
};

/**
 * Script engine whose behaviour is set by the test.
 */
class FakeScriptEngine final : public cadbridge::script::ScriptEngine {
public:
    using Behaviour = std::function<cadbridge::script::ScriptOutcome(
        const std::string& code, const cadbridge::host::ExecutionScope& scope, std::string& output)>;

    FakeScriptEngine();

    const char* name() const override { return "fake"; }
    cadbridge::script::ScriptOutcome run(
        const std::string& code, const cadbridge::host::ExecutionScope& scope, std::string& output) override;

    void set_behaviour(Behaviour behaviour) { behaviour_ = std::move(behaviour); }
    /// Appends `output` and succeeds.
    void print(std::string output);
    /// Appends `output`, then fails with `trace`.
    void fail_after(std::string output, std::string trace);

    int calls() const { return calls_.load(); }
    std::string last_code() const;
    cadbridge::host::ExecutionScope last_scope() const;

private:
    Behaviour behaviour_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::string last_code_;
    cadbridge::host::ExecutionScope last_scope_;
};
