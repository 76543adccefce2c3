#pragma once

#include "api/snapshot_api.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Serves the snapshot API with cpp-httplib on its own listener thread and
// worker pool, so slow peers never hold up the daemon's event loop.
class HttpServer {
public:
    using Handler = std::function<ApiResponse(const std::string& method, const std::string& path)>;

    static constexpr time_t kIoTimeoutSeconds = 5;

    explicit HttpServer(Handler handler, bool verbose = false);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Port 0 picks an ephemeral port; port() reports the bound one.
    bool start(const std::string& host, uint16_t port);
    void stop();

    bool is_running() const { return running_.load(); }
    uint16_t port() const { return port_; }

private:
    void configure_routes(httplib::Server& server);
    void respond(const httplib::Request& req, httplib::Response& res);

    void log(const std::string& msg);

    Handler handler_;
    bool verbose_;

    std::mutex mu_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    uint16_t port_ = 0;
};
