#include "platform/linux/socket_connection.hpp"

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

SocketConnection::SocketConnection(int fd) : fd_(fd) {}

SocketConnection::~SocketConnection() {
    if (fd_ >= 0) ::close(fd_);
}

bool SocketConnection::take_line(std::string& line) {
    auto pos = buf_.find('\n');
    if (pos == std::string::npos) return false;
    line = buf_.substr(0, pos);
    buf_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

Connection::ReadStatus SocketConnection::read_line(std::string& line,
                                                   std::chrono::milliseconds timeout) {
    if (take_line(line)) return ReadStatus::Line;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) return ReadStatus::Error;
    if (rc == 0) return ReadStatus::Timeout;

    char tmp[4096];
    ssize_t n;
    do {
        n = ::recv(fd_, tmp, sizeof(tmp), 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadStatus::Timeout;
        return ReadStatus::Error;
    }
    if (n == 0) return ReadStatus::Closed;

    buf_.append(tmp, static_cast<size_t>(n));
    if (take_line(line)) return ReadStatus::Line;

    if (buf_.size() > kMaxLineBytes) return ReadStatus::Error;
    return ReadStatus::Timeout;
}

bool SocketConnection::write_line(std::string_view line) {
    std::string data(line);
    data.push_back('\n');

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
                if (::poll(&pfd, 1, 1000) <= 0) return false;
                continue;
            }
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

void SocketConnection::shutdown() {
    ::shutdown(fd_, SHUT_RDWR);
}
