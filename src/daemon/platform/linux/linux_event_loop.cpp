#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/websocket_connection.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      hub_(verbose_),
      api_(store_),
      http_server_([this](const std::string& method, const std::string& path) {
          return api_.handle(method, path);
      }, verbose_),
      core_(config_, verbose_, inspector_, health_, hub_, store_,
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    core_.shutdown();
    hub_.stop();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Signal handling via signalfd. Blocked before any thread exists so
    // every worker inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    hub_.start();

    // Hub socket
    auto hub_path = config_.hub_socket();
    if (!hub_server_.start(hub_path)) return false;
    log("Hub listening on " + hub_path);

    // Browser subscribers
    auto ws_endpoint = config_.api.host + ":" + std::to_string(config_.api.ws_port);
    if (!ws_server_.start(ws_endpoint)) return false;
    log("WebSocket hub on " + ws_endpoint + websocket::kPath);

    // Snapshot API, served from its own threads
    if (!http_server_.start(config_.api.host, config_.api.port)) return false;

    // Core init (snapshot db)
    if (!core_.init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Periodic refresh
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    if (!arm_refresh_timer()) return false;

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl({}) failed: {}", fd, std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(timer_fd_, EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(hub_server_.server_fd(), EPOLLIN) ||
        !add_fd(ws_server_.server_fd(), EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);

    // First pass right away rather than one interval in
    core_.request_refresh();
    return true;
}

bool LinuxEventLoop::arm_refresh_timer() {
    itimerspec spec{};
    spec.it_value.tv_sec = config_.scan.interval_seconds;
    spec.it_interval.tv_sec = config_.scan.interval_seconds;
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal " + std::to_string(info.ssi_signo) + ", shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {
                    core_.reap_sessions();
                    core_.request_refresh();
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_refresh_complete();
                }
                continue;
            }

            if (fd == hub_server_.server_fd()) {
                int client_fd = hub_server_.accept_client();
                if (client_fd >= 0) {
                    core_.on_hub_client(client_fd);
                }
                continue;
            }

            if (fd == ws_server_.server_fd()) {
                int client_fd = ws_server_.accept_client();
                if (client_fd >= 0) {
                    core_.on_ws_client(client_fd);
                }
                continue;
            }
        }
    }

    // Clean shutdown
    core_.shutdown();
    hub_.stop();
    hub_server_.stop();
    ws_server_.stop();
    http_server_.stop();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[treewatch] {}", msg);
    }
}
