#include <catch2/catch_test_macros.hpp>

#include "port/allocator.hpp"
#include "port/port_prober.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

// Loopback listener on an ephemeral port, closed on scope exit.
struct Listener {
    int fd = -1;
    uint16_t port = 0;

    Listener() {
        fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd, 4);

        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
    }

    ~Listener() {
        if (fd >= 0) ::close(fd);
    }
};

// Listens on [::1] only, leaving the IPv4 side of the port free.
struct Ipv6Listener {
    int fd = -1;
    uint16_t port = 0;

    Ipv6Listener() {
        fd = ::socket(AF_INET6, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) return;

        int one = 1;
        ::setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &one, sizeof(one));

        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_addr = in6addr_loopback;
        addr.sin6_port = 0;
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 4) != 0) {
            ::close(fd);
            fd = -1;
            return;
        }

        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin6_port);
    }

    ~Ipv6Listener() {
        if (fd >= 0) ::close(fd);
    }

    bool ok() const { return fd >= 0; }
};

} // namespace

TEST_CASE("Port prober", "[port]") {

    SECTION("ListeningPortIsNotAvailable") {
        Listener l;
        REQUIRE(l.port != 0);
        REQUIRE(port::is_listening(l.port));
        REQUIRE_FALSE(port::is_available(l.port));
    }

    SECTION("PortTakenOnOneFamilyIsNotAvailable") {
        Ipv6Listener l6;
        if (!l6.ok()) {
            // No IPv6 loopback on this host: IPv4 alone decides.
            auto free_port = port::find_available_port(21000, 21999);
            REQUIRE(free_port.has_value());
            REQUIRE(port::is_available(*free_port));
            return;
        }

        REQUIRE(l6.port != 0);
        REQUIRE(port::is_listening(l6.port));
        REQUIRE_FALSE(port::is_available(l6.port));
    }

    SECTION("AvailableAndListeningAreExclusive") {
        auto free_port = port::find_available_port(20000, 20999);
        REQUIRE(free_port.has_value());
        REQUIRE(*free_port >= 20000);
        REQUIRE(*free_port <= 20999);
        REQUIRE_FALSE(port::is_listening(*free_port));
    }

    SECTION("OccupiedRangeIsNotFound") {
        Listener l;
        auto res = port::find_available_port(l.port, l.port);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == port::PortError::Kind::NotFound);
    }

    SECTION("WaitForPortSucceedsOnListener") {
        Listener l;
        REQUIRE(port::wait_for_port(l.port, 500ms).has_value());
    }

    SECTION("WaitForPortTimesOut") {
        auto free_port = port::find_available_port(21000, 21999);
        REQUIRE(free_port.has_value());

        auto start = std::chrono::steady_clock::now();
        auto res = port::wait_for_port(*free_port, 300ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == port::PortError::Kind::Timeout);
        REQUIRE(elapsed >= 300ms);
    }

    SECTION("WaitForPortFreeAfterClose") {
        uint16_t p;
        {
            Listener l;
            p = l.port;
            auto busy = port::wait_for_port_free(p, 200ms);
            REQUIRE_FALSE(busy.has_value());
            REQUIRE(busy.error().kind == port::PortError::Kind::Timeout);
        }
        REQUIRE(port::wait_for_port_free(p, 2s).has_value());
    }

    SECTION("ListenerPidIsOurs") {
        Listener l;
        REQUIRE(port::get_listener_pid(l.port) == ::getpid());
    }

    SECTION("NoListenerPid") {
        auto free_port = port::find_available_port(22000, 22999);
        REQUIRE(free_port.has_value());
        REQUIRE(port::get_listener_pid(*free_port) == 0);
    }
}

TEST_CASE("Port allocator", "[port]") {
    port::Allocator alloc(3000, 3999);

    SECTION("Deterministic") {
        auto a = alloc.allocate("feature-auth");
        REQUIRE(a == alloc.allocate("feature-auth"));
        REQUIRE(a == port::Allocator(3000, 3999).allocate("feature-auth"));
        REQUIRE(a >= 3000);
        REQUIRE(a <= 3999);
    }

    SECTION("SpreadsNames") {
        REQUIRE(alloc.allocate("main") != alloc.allocate("feature-auth"));
    }

    SECTION("FallbackSkipsUsedPorts") {
        auto primary = alloc.allocate("main");
        auto res = alloc.allocate_with_fallback("main", {primary});
        REQUIRE(res.has_value());
        REQUIRE(*res != primary);
        REQUIRE(*res >= 3000);
        REQUIRE(*res <= 3999);
    }

    SECTION("SinglePortRange") {
        port::Allocator one(4100, 4100);
        REQUIRE(one.allocate("anything") == 4100);
        auto res = one.allocate_with_fallback("anything", {4100});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == port::PortError::Kind::NotFound);
    }
}
