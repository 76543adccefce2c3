#include "port/port_prober.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <unordered_set>

namespace fs = std::filesystem;

namespace port {

namespace {

enum class BindResult { Bound, InUse, FamilyMissing };

// Owns a socket fd for the duration of a probe.
class ProbeSocket {
public:
    explicit ProbeSocket(int fd) : fd_(fd) {}
    ~ProbeSocket() { if (fd_ >= 0) ::close(fd_); }

    ProbeSocket(const ProbeSocket&) = delete;
    ProbeSocket& operator=(const ProbeSocket&) = delete;

    int fd() const { return fd_; }

    void reset(int fd) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

BindResult try_bind(int family, uint16_t port, ProbeSocket& holder) {
    int fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return errno == EAFNOSUPPORT ? BindResult::FamilyMissing : BindResult::InUse;
    }
    holder.reset(fd);

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    int rc;
    if (family == AF_INET) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        rc = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } else {
        ::setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &one, sizeof(one));
        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(port);
        addr.sin6_addr = in6addr_loopback;
        rc = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    }

    if (rc == 0 && ::listen(fd, 1) == 0) return BindResult::Bound;
    if (errno == EADDRNOTAVAIL && family == AF_INET6) return BindResult::FamilyMissing;
    return BindResult::InUse;
}

bool try_connect(int family, uint16_t port) {
    ProbeSocket sock(::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (sock.fd() < 0) return false;

    int rc;
    if (family == AF_INET) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        rc = ::connect(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } else {
        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(port);
        addr.sin6_addr = in6addr_loopback;
        rc = ::connect(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    }

    if (rc == 0) return true;
    if (errno != EINPROGRESS) return false;

    pollfd pfd{.fd = sock.fd(), .events = POLLOUT, .revents = 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(kConnectTimeout.count()));
    if (ready <= 0) return false;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) return false;
    return so_error == 0;
}

template <typename Pred>
std::expected<void, PortError> poll_until(Pred pred, std::chrono::milliseconds timeout,
                                          std::string what) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return {};
        std::this_thread::sleep_for(kPollInterval);
    }
    return std::unexpected(PortError{PortError::Kind::Timeout, std::move(what)});
}

// Socket inodes in LISTEN state (st == 0A) bound to port, from /proc/net/tcp{,6}.
std::unordered_set<unsigned long> listening_inodes(uint16_t port) {
    std::unordered_set<unsigned long> inodes;

    for (const char* table : {"/proc/net/tcp", "/proc/net/tcp6"}) {
        std::ifstream f(table);
        if (!f.is_open()) continue;

        std::string line;
        std::getline(f, line);  // header
        while (std::getline(f, line)) {
            std::istringstream in(line);
            std::string slot, local, remote, state, queues, timer, retrans, uid, timeout;
            unsigned long inode = 0;
            if (!(in >> slot >> local >> remote >> state >> queues >> timer >> retrans
                     >> uid >> timeout >> inode)) {
                continue;
            }
            if (state != "0A") continue;

            auto colon = local.rfind(':');
            if (colon == std::string::npos) continue;
            unsigned int local_port = 0;
            auto hex = std::string_view(local).substr(colon + 1);
            auto [ptr, err] = std::from_chars(hex.data(), hex.data() + hex.size(), local_port, 16);
            if (err != std::errc() || local_port != port) continue;

            if (inode != 0) inodes.insert(inode);
        }
    }

    return inodes;
}

} // namespace

bool is_available(uint16_t port) {
    ProbeSocket v4(-1);
    auto r4 = try_bind(AF_INET, port, v4);
    if (r4 != BindResult::Bound) return false;

    // Hold the IPv4 bind while probing IPv6; both release on return.
    ProbeSocket v6(-1);
    auto r6 = try_bind(AF_INET6, port, v6);
    // Without an IPv6 loopback nothing can hold the port on that family, so
    // IPv4 alone decides there. Everywhere else both binds must succeed.
    return r6 != BindResult::InUse;
}

bool is_listening(uint16_t port) {
    if (try_connect(AF_INET, port)) return true;
    return try_connect(AF_INET6, port);
}

std::expected<void, PortError> wait_for_port(uint16_t port, std::chrono::milliseconds timeout) {
    return poll_until([port] { return is_listening(port); }, timeout,
                      std::format("timeout waiting for port {} to become available", port));
}

std::expected<void, PortError> wait_for_port_free(uint16_t port, std::chrono::milliseconds timeout) {
    return poll_until([port] { return is_available(port); }, timeout,
                      std::format("timeout waiting for port {} to become free", port));
}

std::expected<uint16_t, PortError> find_available_port(uint16_t min_port, uint16_t max_port) {
    for (uint32_t p = min_port; p <= max_port; ++p) {
        if (p == 0) continue;
        if (is_available(static_cast<uint16_t>(p))) return static_cast<uint16_t>(p);
    }
    return std::unexpected(PortError{
        PortError::Kind::NotFound,
        std::format("no available ports in range {}-{}", min_port, max_port),
    });
}

int get_listener_pid(uint16_t port) {
    auto inodes = listening_inodes(port);
    if (inodes.empty()) return 0;

    std::error_code ec;
    for (auto& proc : fs::directory_iterator("/proc", ec)) {
        auto name = proc.path().filename().string();
        int pid = 0;
        auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (err != std::errc() || ptr != name.data() + name.size()) continue;

        std::error_code fd_ec;
        for (auto& fd : fs::directory_iterator(proc.path() / "fd", fd_ec)) {
            std::error_code link_ec;
            auto target = fs::read_symlink(fd.path(), link_ec).string();
            if (link_ec || !target.starts_with("socket:[")) continue;

            unsigned long inode = 0;
            auto digits = std::string_view(target).substr(8);
            std::from_chars(digits.data(), digits.data() + digits.size(), inode);
            if (inodes.contains(inode)) return pid;
        }
    }

    return 0;
}

} // namespace port
