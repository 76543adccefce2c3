#pragma once

#include "platform/connection.hpp"

#include <string>

// Connection over a connected stream socket. Takes ownership of the fd.
class SocketConnection : public Connection {
public:
    static constexpr size_t kMaxLineBytes = 1 << 20;

    explicit SocketConnection(int fd);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout) override;
    bool write_line(std::string_view line) override;
    void shutdown() override;

    int fd() const { return fd_; }

private:
    bool take_line(std::string& line);

    int fd_;
    std::string buf_;
};
