#pragma once

#include "port/port_prober.hpp"

#include <cstdint>
#include <expected>
#include <set>
#include <string_view>
#include <utility>

namespace port {

// Deterministic port assignment: the same workspace name always hashes to
// the same port in [min, max].
class Allocator {
public:
    Allocator(uint16_t min_port, uint16_t max_port);

    uint16_t allocate(std::string_view name) const;

    // Primary port, then "name-1" .. "name-100", then a linear scan.
    // Ports in `used` are skipped even if they probe free.
    std::expected<uint16_t, PortError>
    allocate_with_fallback(std::string_view name, const std::set<uint16_t>& used) const;

    std::pair<uint16_t, uint16_t> range() const { return {min_port_, max_port_}; }

private:
    uint16_t min_port_;
    uint16_t max_port_;
};

} // namespace port
