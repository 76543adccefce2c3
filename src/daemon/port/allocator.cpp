#include "port/allocator.hpp"

#include <format>
#include <string>

namespace port {

namespace {

uint32_t fnv1a32(std::string_view s) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

} // namespace

Allocator::Allocator(uint16_t min_port, uint16_t max_port)
    : min_port_(min_port), max_port_(max_port < min_port ? min_port : max_port) {}

uint16_t Allocator::allocate(std::string_view name) const {
    uint32_t span = static_cast<uint32_t>(max_port_ - min_port_) + 1;
    return static_cast<uint16_t>(min_port_ + fnv1a32(name) % span);
}

std::expected<uint16_t, PortError>
Allocator::allocate_with_fallback(std::string_view name, const std::set<uint16_t>& used) const {
    auto usable = [&used](uint16_t p) { return !used.contains(p) && is_available(p); };

    uint16_t primary = allocate(name);
    if (usable(primary)) return primary;

    for (int i = 1; i <= 100; ++i) {
        uint16_t alt = allocate(std::format("{}-{}", name, i));
        if (usable(alt)) return alt;
    }

    for (uint32_t p = min_port_; p <= max_port_; ++p) {
        if (usable(static_cast<uint16_t>(p))) return static_cast<uint16_t>(p);
    }

    return std::unexpected(PortError{
        PortError::Kind::NotFound,
        std::format("no available ports in range {}-{}", min_port_, max_port_),
    });
}

} // namespace port
