#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    buf_.clear();
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& msg) {
    if (fd_ < 0) return false;
    std::string line = msg.dump() + "\n";

    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::send(fd_, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& msg, int timeout_ms) {
    if (fd_ < 0) return false;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    while (true) {
        auto pos = buf_.find('\n');
        if (pos != std::string::npos) {
            auto line = buf_.substr(0, pos);
            buf_.erase(0, pos + 1);
            try {
                msg = nlohmann::json::parse(line);
                return true;
            } catch (const nlohmann::json::exception& e) {
                std::println(stderr, "ipc: bad message from daemon: {}", e.what());
                return false;
            }
        }

        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;

        buf_.append(tmp, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}
