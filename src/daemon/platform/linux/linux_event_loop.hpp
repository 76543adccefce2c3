#pragma once

#include "api/http_server.hpp"
#include "api/snapshot_api.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "hub/hub.hpp"
#include "platform/linux/procfs_inspector.hpp"
#include "platform/linux/tcp_socket_server.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "servers/http_health_checker.hpp"
#include "snapshot_store.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    bool arm_refresh_timer();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations and shared services (constructed before core_)
    ProcfsInspector inspector_;
    HttpHealthChecker health_;
    Hub hub_;
    SnapshotStore store_;
    SnapshotApi api_;
    HttpServer http_server_;
    UnixSocketServer hub_server_;
    TcpSocketServer ws_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
