#pragma once

#include <chrono>
#include <string>
#include <string_view>

// A bidirectional stream of text messages, one JSON document each. Reads and
// writes may run on different threads; shutdown() may be called from any
// thread and wakes both.
class Connection {
public:
    enum class ReadStatus { Line, Timeout, Closed, Error };

    virtual ~Connection() = default;

    // Protocol negotiation before the first read or write. Plain streams
    // have none.
    virtual bool handshake(std::chrono::milliseconds /*timeout*/) { return true; }

    // Waits up to `timeout` for a complete message (without framing).
    virtual ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout) = 0;
    virtual bool write_line(std::string_view line) = 0;
    virtual void shutdown() = 0;
};
