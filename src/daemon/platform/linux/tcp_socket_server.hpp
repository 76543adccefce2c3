#pragma once

#include "platform/ipc_server.hpp"

#include <cstdint>
#include <string>

// IPv4 TCP listener for browser subscribers. Endpoint is "host:port";
// port 0 binds an ephemeral port, reported by port().
class TcpSocketServer : public IpcServer {
public:
    static constexpr int kBacklog = 16;

    TcpSocketServer();
    ~TcpSocketServer() override;

    TcpSocketServer(const TcpSocketServer&) = delete;
    TcpSocketServer& operator=(const TcpSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;

    uint16_t port() const { return port_; }

private:
    int server_fd_ = -1;
    uint16_t port_ = 0;
};
