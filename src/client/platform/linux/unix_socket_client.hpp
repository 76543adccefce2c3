#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& msg) override;
    bool recv(nlohmann::json& msg, int timeout_ms = -1) override;
    void close() override;

private:
    int fd_ = -1;
    std::string buf_;  // bytes past the last returned line
};
