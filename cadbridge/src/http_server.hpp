#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cadbridge {

struct HttpRequest {
    std::string method;
    std::string target;
    std::string body;
};

struct HttpReply {
    unsigned status = 200;
    std::string body;
    std::string content_type = "application/json";
};

/**
 * Minimal HTTP/1.1 server: one epoll thread accepts connections and frames
 * requests, a worker pool runs the handler and writes the reply. One request
 * per connection.
 */
class HttpServer {
public:
    using RequestHandler = std::function<HttpReply(const HttpRequest& request)>;

    /**
     * @param host Address or host name to bind
     * @param port TCP port, 0 picks an ephemeral one
     * @param handler Called on a worker thread for every complete request
     * @param thread_pool_size Number of worker threads
     */
    HttpServer(std::string host, uint16_t port, RequestHandler handler, size_t thread_pool_size = 4);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Returns false when the socket cannot be bound. A second start() is a no-op.
    bool start();

    /// Safe to call at any time, including before start(), twice, or from two
    /// threads at once. Returns after the sockets are released.
    void stop();

    /// Connections that have not delivered a complete request within this
    /// time are closed. Call before start().
    void set_request_timeout(std::chrono::milliseconds timeout) { request_timeout_ = timeout; }

    bool is_running() const { return running_.load(); }

    /// Bound port once started, otherwise the configured one.
    uint16_t port() const { return bound_port_.load(); }

private:
    struct Connection;

    struct ClientTask {
        int client_fd = -1;
        HttpRequest request;
        bool malformed = false;
        std::string error;
    };

    std::string host_;
    uint16_t port_;
    RequestHandler handler_;
    size_t thread_pool_size_;
    std::chrono::milliseconds request_timeout_{30000};
    std::mutex lifecycle_mutex_;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_;

    // Accept thread
    std::thread accept_thread_;
    std::unordered_map<int, std::unique_ptr<Connection>> connections_; // accept thread only

    // Thread pool members
    std::vector<std::thread> worker_threads_;
    std::queue<ClientTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> pool_running_{false};

    std::unordered_set<int> client_fds_;
    std::mutex client_fds_mutex_;

    bool setup_socket();
    void release_sockets();
    void accept_loop();
    void accept_client();
    void read_client(int client_fd, uint32_t events);
    void drop_client(int client_fd);
    void drop_expired_clients();
    void dispatch_client(int client_fd, ClientTask task);
    void worker_thread_func();
    void handle_client(ClientTask& task);
    void send_reply(int client_fd, const HttpReply& reply);
};

} // namespace cadbridge
