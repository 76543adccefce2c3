#pragma once

#include <string>

// Listening endpoint for hub subscribers. Accepted fds are handed off;
// the server does not track them.
class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
};
