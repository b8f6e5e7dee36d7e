#include "http_server.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace cadbridge {

namespace http = boost::beast::http;

namespace {

constexpr size_t kReadChunk = 8192;
constexpr uint64_t kBodyLimit = 16 * 1024 * 1024;
constexpr int kMaxEvents = 32;
constexpr int kPollIntervalMs = 1000;

std::string errno_text() {
    return std::strerror(errno);
}

HttpReply malformed_reply(const std::string& detail) {
    HttpReply reply;
    reply.status = 400;
    reply.body = codec::serialize(codec::error_envelope(make_bad_request("Malformed HTTP request: " + detail)));
    return reply;
}

} // namespace

struct HttpServer::Connection {
    explicit Connection(std::chrono::steady_clock::time_point expires) : deadline(expires) {
        parser.eager(true);
        parser.body_limit(kBodyLimit);
    }

    std::chrono::steady_clock::time_point deadline;
    http::request_parser<http::string_body> parser;
    std::string pending;
};

HttpServer::HttpServer(std::string host, uint16_t port, RequestHandler handler, size_t thread_pool_size)
    : host_(std::move(host)),
      port_(port),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 4),
      bound_port_(port) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::setup_socket() {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    const std::string port_text = std::to_string(port_);
    int rc = ::getaddrinfo(host_.empty() ? nullptr : host_.c_str(), port_text.c_str(), &hints, &result);
    if (rc != 0) {
        LOG4CPLUS_ERROR(server_logger(), "Cannot resolve " << host_ << ": " << ::gai_strerror(rc));
        return false;
    }

    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            LOG4CPLUS_WARN(server_logger(), "socket: " << errno_text());
            continue;
        }

        int reuse = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            LOG4CPLUS_WARN(server_logger(), "setsockopt SO_REUSEADDR: " << errno_text());
        }

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, SOMAXCONN) == 0) {
            server_fd_ = fd;
            break;
        }
        LOG4CPLUS_ERROR(server_logger(), "bind/listen " << host_ << ":" << port_ << ": " << errno_text());
        ::close(fd);
    }
    ::freeaddrinfo(result);

    if (server_fd_ < 0) {
        return false;
    }

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    }
    return true;
}

void HttpServer::release_sockets() {
    for (int* fd : {&server_fd_, &epoll_fd_, &wake_fd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

bool HttpServer::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        LOG4CPLUS_WARN(server_logger(), "HTTP server already running on " << host_ << ":" << port());
        return true;
    }

    if (!setup_socket()) {
        release_sockets();
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(server_logger(), "epoll_create1: " << errno_text());
        release_sockets();
        return false;
    }

    wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd_ < 0) {
        LOG4CPLUS_ERROR(server_logger(), "eventfd: " << errno_text());
        release_sockets();
        return false;
    }

    for (int fd : {server_fd_, wake_fd_}) {
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = fd;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            LOG4CPLUS_ERROR(server_logger(), "epoll_ctl ADD: " << errno_text());
            release_sockets();
            return false;
        }
    }

    running_ = true;

    pool_running_ = true;
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&HttpServer::worker_thread_func, this);
    }

    accept_thread_ = std::thread(&HttpServer::accept_loop, this);

    LOG4CPLUS_INFO(server_logger(), "HTTP server listening on " << host_ << ":" << port()
                                        << " with " << thread_pool_size_ << " workers");
    return true;
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        LOG4CPLUS_DEBUG(server_logger(), "HTTP server not running, nothing to stop");
        return;
    }

    // Wake epoll_wait() so the accept thread sees running_ == false
    uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0) {
        LOG4CPLUS_WARN(server_logger(), "eventfd write: " << errno_text());
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pool_running_ = false;
    }
    queue_cv_.notify_all();
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();

    // Queued requests are dropped; their sockets are closed with the idle ones
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::queue<ClientTask> empty;
        task_queue_.swap(empty);
    }
    connections_.clear();
    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        for (int fd : client_fds_) {
            ::close(fd);
        }
        client_fds_.clear();
    }

    release_sockets();
    LOG4CPLUS_INFO(server_logger(), "HTTP server stopped");
}

void HttpServer::accept_loop() {
    epoll_event events[kMaxEvents];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, kPollIntervalMs);
        if (nfds < 0) {
            if (errno != EINTR && running_) {
                LOG4CPLUS_ERROR(server_logger(), "epoll_wait: " << errno_text());
            }
            continue;
        }
        drop_expired_clients();

        for (int i = 0; i < nfds && running_; ++i) {
            int fd = events[i].data.fd;
            if (fd == wake_fd_) {
                continue;
            }
            if (fd == server_fd_) {
                accept_client();
            } else {
                read_client(fd, events[i].events);
            }
        }
    }
}

void HttpServer::accept_client() {
    int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EINTR) {
            LOG4CPLUS_WARN(server_logger(), "accept: " << errno_text());
        }
        return;
    }

    timeval send_timeout{5, 0};
    if (::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout)) < 0) {
        LOG4CPLUS_WARN(server_logger(), "setsockopt SO_SNDTIMEO: " << errno_text());
    }

    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP;
    ev.data.fd = client_fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
        LOG4CPLUS_WARN(server_logger(), "epoll_ctl ADD client: " << errno_text());
        ::close(client_fd);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        client_fds_.insert(client_fd);
    }
    connections_[client_fd] = std::make_unique<Connection>(std::chrono::steady_clock::now() + request_timeout_);
}

void HttpServer::read_client(int client_fd, uint32_t events) {
    auto it = connections_.find(client_fd);
    if (it == connections_.end()) {
        drop_client(client_fd);
        return;
    }
    if ((events & (EPOLLERR | EPOLLHUP)) && !(events & EPOLLIN)) {
        drop_client(client_fd);
        return;
    }

    char buffer[kReadChunk];
    ssize_t received = ::recv(client_fd, buffer, sizeof(buffer), MSG_DONTWAIT);
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        LOG4CPLUS_DEBUG(server_logger(), "recv: " << errno_text());
        drop_client(client_fd);
        return;
    }
    if (received == 0) {
        // Peer closed before sending a complete request
        drop_client(client_fd);
        return;
    }

    Connection& conn = *it->second;
    conn.pending.append(buffer, static_cast<size_t>(received));

    boost::beast::error_code ec;
    while (!conn.parser.is_done() && !conn.pending.empty()) {
        size_t used = conn.parser.put(boost::asio::buffer(conn.pending.data(), conn.pending.size()), ec);
        conn.pending.erase(0, used);
        if (ec == http::error::need_more) {
            ec = {};
            break;
        }
        if (ec || used == 0) {
            break;
        }
    }

    ClientTask task;
    task.client_fd = client_fd;
    if (ec) {
        LOG4CPLUS_WARN(server_logger(), "Malformed HTTP request: " << ec.message());
        task.malformed = true;
        task.error = ec.message();
        dispatch_client(client_fd, std::move(task));
        return;
    }
    if (!conn.parser.is_done()) {
        return;
    }

    auto message = conn.parser.release();
    auto method = message.method_string();
    auto target = message.target();
    task.request.method.assign(method.data(), method.size());
    task.request.target.assign(target.data(), target.size());
    task.request.body = std::move(message.body());
    dispatch_client(client_fd, std::move(task));
}

void HttpServer::drop_client(int client_fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, client_fd, nullptr);
    connections_.erase(client_fd);

    std::lock_guard<std::mutex> lock(client_fds_mutex_);
    if (client_fds_.erase(client_fd) != 0) {
        ::close(client_fd);
    }
}

void HttpServer::drop_expired_clients() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<int> expired;
    for (const auto& entry : connections_) {
        if (entry.second->deadline <= now) {
            expired.push_back(entry.first);
        }
    }
    for (int fd : expired) {
        LOG4CPLUS_DEBUG(server_logger(), "Closing client " << fd << ": no complete request before the deadline");
        drop_client(fd);
    }
}

void HttpServer::dispatch_client(int client_fd, ClientTask task) {
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, client_fd, nullptr) < 0) {
        LOG4CPLUS_WARN(server_logger(), "epoll_ctl DEL client: " << errno_text());
    }
    connections_.erase(client_fd);

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void HttpServer::worker_thread_func() {
    while (true) {
        ClientTask task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });
            if (!pool_running_) {
                return;
            }
            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        handle_client(task);
    }
}

void HttpServer::handle_client(ClientTask& task) {
    HttpReply reply;
    if (task.malformed) {
        reply = malformed_reply(task.error);
    } else {
        LOG4CPLUS_DEBUG(server_logger(), task.request.method << " " << task.request.target
                                             << " (" << task.request.body.size() << " bytes)");
        try {
            reply = handler_(task.request);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Request handler failed: " << exc.what());
            reply = HttpReply{};
            reply.status = 500;
            reply.body = codec::serialize(codec::error_envelope(
                make_internal_error(std::string("An unexpected internal error occurred: ") + exc.what())));
        }
    }

    send_reply(task.client_fd, reply);

    std::lock_guard<std::mutex> lock(client_fds_mutex_);
    if (client_fds_.erase(task.client_fd) != 0) {
        ::close(task.client_fd);
    }
}

void HttpServer::send_reply(int client_fd, const HttpReply& reply) {
    http::response<http::string_body> response;
    response.version(11);
    response.result(reply.status);
    response.set(http::field::server, "cadbridge");
    response.set(http::field::content_type, reply.content_type);
    response.set(http::field::connection, "close");
    response.body() = reply.body;
    response.prepare_payload();

    std::ostringstream out;
    out << response;
    const std::string bytes = out.str();

    size_t offset = 0;
    while (offset < bytes.size()) {
        ssize_t sent = ::send(client_fd, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_WARN(server_logger(), "send: " << errno_text());
            return;
        }
        offset += static_cast<size_t>(sent);
    }
}

} // namespace cadbridge
