#include "api/http_server.hpp"

#include <print>

HttpServer::HttpServer(Handler handler, bool verbose)
    : handler_(std::move(handler)), verbose_(verbose) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(const std::string& host, uint16_t port) {
    std::unique_lock lock(mu_);
    if (server_) return true;

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kIoTimeoutSeconds, 0);
    server_->set_write_timeout(kIoTimeoutSeconds, 0);
    server_->set_keep_alive_max_count(1);
    server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Connection", "close"},
    });
    configure_routes(*server_);

    int bound = port == 0 ? server_->bind_to_any_port(host)
                          : (server_->bind_to_port(host, port) ? port : -1);
    if (bound < 0) {
        std::println(stderr, "api: failed to bind {}:{}", host, port);
        server_.reset();
        return false;
    }
    port_ = static_cast<uint16_t>(bound);

    running_.store(true);
    listen_thread_ = std::thread([this] {
        if (!server_->listen_after_bind()) {
            std::println(stderr, "api: listener on port {} exited", port_);
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();
    lock.lock();

    if (!server_->is_running()) {
        std::println(stderr, "api: server failed to start listening");
        server_->stop();
        if (listen_thread_.joinable()) listen_thread_.join();
        server_.reset();
        port_ = 0;
        return false;
    }

    log("API listening on " + host + ":" + std::to_string(port_));
    return true;
}

void HttpServer::stop() {
    std::unique_lock lock(mu_);
    if (!server_) return;

    server_->stop();
    if (listen_thread_.joinable()) listen_thread_.join();
    server_.reset();
    port_ = 0;
    running_.store(false);
}

void HttpServer::configure_routes(httplib::Server& server) {
    auto forward = [this](const httplib::Request& req, httplib::Response& res) {
        respond(req, res);
    };

    // Every verb goes through the handler so it decides 404 versus 405.
    server.Get(R"(/.*)", forward);
    server.Post(R"(/.*)", forward);
    server.Put(R"(/.*)", forward);
    server.Patch(R"(/.*)", forward);
    server.Delete(R"(/.*)", forward);
    server.Options(R"(/.*)", forward);
}

void HttpServer::respond(const httplib::Request& req, httplib::Response& res) {
    auto resp = handler_(req.method, req.path);
    res.status = resp.status;
    res.set_content(resp.body, "application/json");
    log(req.method + " " + req.path + " -> " + std::to_string(resp.status));
}

void HttpServer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[treewatch] {}", msg);
    }
}
