#pragma once
#include "config.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

struct HttpServerConfig {
    int port = cfg::SERVER_PORT;
    int backlog = cfg::HTTP_BACKLOG;
    size_t max_header_bytes = cfg::HTTP_MAX_HEADER_BYTES;
    size_t max_body_bytes = cfg::HTTP_MAX_BODY_BYTES;
};

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::unordered_map<std::string,std::string> headers;
    std::string body;
};

// Raw writer handed to streaming responses once the status line is out.
class ResponseStream {
public:
    explicit ResponseStream(int fd, const std::atomic<bool>* serving = nullptr)
        : fd_(fd), serving_(serving) {}
    bool write(const void* data, size_t len);
    bool write(const std::string& s) { return write(s.data(), s.size()); }
    // False once a send failed or the server is shutting down.
    bool ok() const { return ok_ && (!serving_ || serving_->load()); }

private:
    int fd_;
    const std::atomic<bool>* serving_;
    bool ok_ = true;
};

struct HttpResponse {
    int status = 200;
    std::unordered_map<std::string,std::string> headers;
    std::string body;
    // When set, headers go out without Content-Length and the callback owns the
    // connection until it returns.
    std::function<void(ResponseStream&)> stream;
};

using RouteHandler = std::function<void(const HttpRequest&, HttpResponse&)>;

// Minimal blocking HTTP/1.1 server, one detached thread per connection.
class HttpServer {
public:
    explicit HttpServer(const HttpServerConfig& config = HttpServerConfig());
    ~HttpServer() { stop(); }

    bool start();
    // Stops accepting, hangs up open connections and waits for their threads.
    void stop();
    int port() const { return bound_port_; }
    void add_route(const std::string& method, const std::string& path, RouteHandler h);

    // Routes a parsed request without a socket.
    HttpResponse dispatch(const HttpRequest& req) const;
    int connections() const { return connections_; }

    // Reads one request, replies and closes cfd.
    void serve_connection(int cfd);
    // 0 on success, an HTTP error status to reply with, or -1 if the peer went away.
    int read_request(int fd, HttpRequest& req) const;

    static bool send_all(int fd, const void* data, size_t len);
    static std::string status_text(int status);
    static std::string response_head(const HttpResponse& res);

private:
    HttpServerConfig config_;
    int server_fd_ = -1;
    int bound_port_ = 0;
    std::thread th_;
    std::atomic<bool> run_{false};
    std::atomic<int> connections_{0};
    std::mutex clients_m_;
    std::condition_variable clients_cv_;
    std::unordered_set<int> clients_;
    std::unordered_map<std::string, std::unordered_map<std::string, RouteHandler>> routes_;

    void loop();
};

// application/x-www-form-urlencoded or query string -> map
std::unordered_map<std::string,std::string> parse_form(const std::string& body);
