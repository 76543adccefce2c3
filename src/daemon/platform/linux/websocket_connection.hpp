#pragma once

#include "platform/connection.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace websocket {

constexpr const char* kPath = "/ws";

// Sec-WebSocket-Accept for a client's Sec-WebSocket-Key (RFC 6455 §4.2.2).
std::string accept_key(const std::string& client_key);

// Unmasked server-to-client frame.
std::vector<uint8_t> build_frame(uint8_t opcode, std::string_view payload);

} // namespace websocket

// Server side of a WebSocket over an accepted TCP socket. Owns the fd. Each
// text message carries one envelope; pings are answered internally.
class WebSocketConnection : public Connection {
public:
    static constexpr size_t kMaxRequestBytes = 16 * 1024;
    static constexpr size_t kMaxMessageBytes = 1 << 20;

    explicit WebSocketConnection(int fd);
    ~WebSocketConnection() override;

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    // Reads the HTTP upgrade request within `timeout` overall and answers
    // 101, or 400/404 and false.
    bool handshake(std::chrono::milliseconds timeout) override;

    ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout) override;
    bool write_line(std::string_view line) override;
    void shutdown() override;

private:
    enum class FillStatus { Data, Timeout, Closed, Error };

    // nullopt: the buffer holds no complete message yet.
    std::optional<ReadStatus> take_message(std::string& line);
    FillStatus fill(std::chrono::milliseconds timeout);
    bool send_frame(uint8_t opcode, std::string_view payload);
    bool send_all(std::string_view data);
    void reject(int status, const std::string& reason);

    int fd_;
    std::string buf_;
    std::string fragment_;
    std::mutex write_mu_;
};
