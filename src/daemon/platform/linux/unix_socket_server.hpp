#pragma once

#include "platform/ipc_server.hpp"

#include <string>

class UnixSocketServer : public IpcServer {
public:
    static constexpr int kBacklog = 16;

    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;

private:
    int server_fd_ = -1;
    std::string socket_path_;
};
