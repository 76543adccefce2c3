#pragma once

#include <nlohmann/json.hpp>
#include <string>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& msg) = 0;
    // One newline-delimited JSON message. Negative timeout waits forever.
    virtual bool recv(nlohmann::json& msg, int timeout_ms = -1) = 0;
    virtual void close() = 0;
};
