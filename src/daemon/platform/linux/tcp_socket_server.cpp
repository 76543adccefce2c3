#include "platform/linux/tcp_socket_server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <netinet/in.h>
#include <print>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>

TcpSocketServer::TcpSocketServer() = default;

TcpSocketServer::~TcpSocketServer() {
    stop();
}

bool TcpSocketServer::start(const std::string& endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos) {
        std::println(stderr, "ws: endpoint must be host:port: {}", endpoint);
        return false;
    }
    std::string host = endpoint.substr(0, colon);
    unsigned port = 0;
    auto port_str = std::string_view(endpoint).substr(colon + 1);
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc() || ptr != port_str.data() + port_str.size() || port > 65535) {
        std::println(stderr, "ws: invalid port in {}", endpoint);
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        std::println(stderr, "ws: invalid listen address: {}", host);
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ws: socket() failed: {}", std::strerror(errno));
        return false;
    }

    int one = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ws: bind({}) failed: {}", endpoint, std::strerror(errno));
        stop();
        return false;
    }

    if (::listen(server_fd_, kBacklog) < 0) {
        std::println(stderr, "ws: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    }
    return true;
}

void TcpSocketServer::stop() {
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    port_ = 0;
}

int TcpSocketServer::accept_client() {
    int fd;
    do {
        fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    return fd;
}
