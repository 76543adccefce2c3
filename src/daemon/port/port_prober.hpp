#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

namespace port {

struct PortError {
    enum class Kind { Timeout, NotFound };

    Kind kind;
    std::string message;
};

inline constexpr auto kPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kConnectTimeout = std::chrono::milliseconds(100);

// True only if the port binds on both 127.0.0.1 and ::1. A port usable on
// just one family counts as taken. Hosts without an IPv6 loopback are
// judged on IPv4 alone.
bool is_available(uint16_t port);

// True if a connect to 127.0.0.1 or ::1 succeeds (IPv4 tried first).
bool is_listening(uint16_t port);

// Poll is_listening until it holds or the timeout elapses.
std::expected<void, PortError> wait_for_port(uint16_t port, std::chrono::milliseconds timeout);

// Poll is_available until it holds or the timeout elapses.
std::expected<void, PortError> wait_for_port_free(uint16_t port, std::chrono::milliseconds timeout);

// First available port in [min_port, max_port].
std::expected<uint16_t, PortError> find_available_port(uint16_t min_port, uint16_t max_port);

// Best-effort owner of a listening socket on port. 0 when unknown; the
// answer is advisory and may already be stale when returned.
int get_listener_pid(uint16_t port);

} // namespace port
